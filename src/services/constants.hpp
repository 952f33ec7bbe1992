#pragma once

#include <string>
#include <string_view>

namespace services::constants {
    typedef std::string_view metadata;
    // the name a subscriber registers under.
    constexpr metadata subscriber_md = "subscriber";

    // the generic method serving element streams.
    constexpr std::string_view subscribe_method = "/streamgate.Stream/Subscribe";

    // defines the max message size a server expects: 5mb.
    constexpr int max_message_size = 1024 * 1024 * 5;
}
