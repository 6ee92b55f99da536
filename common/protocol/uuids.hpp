#pragma once

#include <array>

namespace ember::uuids {

// Primary mug service
constexpr const char* SERVICE = "fc543622-236c-4c94-8fa9-944a3e5353fa";

// Characteristics read every poll cycle
constexpr const char* CURRENT_TEMP = "fc540002-236c-4c94-8fa9-944a3e5353fa";
constexpr const char* TARGET_TEMP = "fc540003-236c-4c94-8fa9-944a3e5353fa";
constexpr const char* BATTERY = "fc540007-236c-4c94-8fa9-944a3e5353fa";
constexpr const char* LED_COLOR = "fc540014-236c-4c94-8fa9-944a3e5353fa";

// Subscribed for status pushes
constexpr const char* STATE = "fc540008-236c-4c94-8fa9-944a3e5353fa";

// Readable characteristics with unknown meaning, only dumped for investigation
constexpr std::array<const char*, 9> UNKNOWN_READ = {
    "fc540001-236c-4c94-8fa9-944a3e5353fa",
    "fc540004-236c-4c94-8fa9-944a3e5353fa",
    "fc540005-236c-4c94-8fa9-944a3e5353fa",
    "fc540006-236c-4c94-8fa9-944a3e5353fa",
    "fc54000c-236c-4c94-8fa9-944a3e5353fa",
    "fc54000d-236c-4c94-8fa9-944a3e5353fa",
    "fc54000e-236c-4c94-8fa9-944a3e5353fa",
    "fc54000f-236c-4c94-8fa9-944a3e5353fa",
    "fc540013-236c-4c94-8fa9-944a3e5353fa",
};

// Advertised local name used by the discovery tool
constexpr const char* ADVERTISED_NAME = "Ember Ceramic Mug";

} // namespace ember::uuids
