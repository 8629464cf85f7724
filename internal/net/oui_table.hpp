#pragma once

#include <string>
#include <string_view>

namespace scout::net {

// Vendor for the MAC's OUI prefix, empty when unknown. Accepts ':' or '-' separators, any case.
std::string LookupMacVendor(std::string_view mac);

} // namespace scout::net
