#include "services/utils.hpp"
#include <cassert>
#include <iostream>

int utils_test(int, char *[]) {
    assert(services::utils::extract_ip("ipv4:127.0.0.1:5051") == "127.0.0.1");
    assert(services::utils::extract_ip("ipv6:%5B::1%5D:5051") == "::1");
    assert(services::utils::extract_ip("ipv6:%5bfe80::1%5d:5051") == "fe80::1");
    assert(services::utils::extract_ip("unix:/tmp/streamgate.sock") == "unix:/tmp/streamgate.sock");

    assert(services::utils::parse_non_negative_int("3").value() == 3);
    assert(services::utils::parse_non_negative_int("0").value() == 0);
    assert(!services::utils::parse_non_negative_int("abc"));
    assert(!services::utils::parse_non_negative_int("-1"));
    assert(!services::utils::parse_non_negative_int("3x"));
    assert(!services::utils::parse_non_negative_int(""));
    assert(!services::utils::parse_non_negative_int("99999999999999999999"));

    std::cout << "utils_test: ok" << std::endl;
    return 0;
}
