#include "upnp_description.hpp"

#include <pugixml.hpp>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::net {

namespace {

std::string Text(const pugi::xml_node& node, const char* name) {
  return util::Trim(node.child(name).child_value());
}

void CollectServices(const pugi::xml_node& device, std::vector<std::string>& out, int depth) {
  for (auto service : device.child("serviceList").children("service")) {
    auto type = Text(service, "serviceType");
    if (!type.empty()) {
      out.push_back(std::move(type));
    }
  }
  if (depth <= 0) {
    return;
  }
  for (auto child : device.child("deviceList").children("device")) {
    CollectServices(child, out, depth - 1);
  }
}

} // namespace

DeviceDescription ParseDeviceDescription(std::string_view xml) {
  pugi::xml_document     doc;
  const unsigned int     flags  = pugi::parse_default & ~pugi::parse_doctype;
  pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size(), flags, pugi::encoding_utf8);
  if (!result) {
    throw util::MalformedEvidence(std::string("device description: ") + result.description());
  }

  auto device = doc.child("root").child("device");
  if (!device) {
    throw util::MalformedEvidence("device description has no root/device element");
  }

  DeviceDescription out;
  out.device_type       = Text(device, "deviceType");
  out.friendly_name     = Text(device, "friendlyName");
  out.manufacturer      = Text(device, "manufacturer");
  out.model_name        = Text(device, "modelName");
  out.model_description = Text(device, "modelDescription");
  out.model_number      = Text(device, "modelNumber");
  out.serial_number     = Text(device, "serialNumber");
  out.udn               = Text(device, "UDN");

  // Two levels covers gateways and media renderers seen in practice.
  CollectServices(device, out.service_types, 2);
  return out;
}

std::string ShortUpnpType(std::string_view urn) {
  auto parts = util::Split(urn, ':');
  // urn:<domain>:device|service:<type>:<version>
  if (parts.size() >= 5 && parts[0] == "urn") {
    return parts[3];
  }
  return std::string(urn);
}

} // namespace scout::net
