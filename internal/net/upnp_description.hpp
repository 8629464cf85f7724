#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace scout::net {

/*
  Fields of a UPnP device description document (root/device).

  Embedded devices are not walked; their service types are appended to
  service_types so a hub that exposes everything through children is
  still recognisable.
*/
struct DeviceDescription {
  std::string device_type;
  std::string friendly_name;
  std::string manufacturer;
  std::string model_name;
  std::string model_description;
  std::string model_number;
  std::string serial_number;
  std::string udn;

  std::vector<std::string> service_types;
};

// Throws util::MalformedEvidence when the document is not XML or has no root/device.
DeviceDescription ParseDeviceDescription(std::string_view xml);

// "urn:schemas-upnp-org:device:MediaRenderer:1" -> "MediaRenderer"
std::string ShortUpnpType(std::string_view urn);

} // namespace scout::net
