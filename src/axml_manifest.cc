#include "axml.hpp"

#include <cstring>
#include <pugixml.hpp>
#include <sstream>
#include <utility>

namespace libaxml {

namespace {

void parseDecodedXml(pugi::xml_document &doc, const std::string &xml,
                     unsigned int flags) {
  pugi::xml_parse_result result = doc.load_string(xml.c_str(), flags);
  if (!result) {
    throw std::runtime_error("Failed to parse XML string: " +
                             std::string(result.description()));
  }
}

// Prefix bound to the Android namespace on the root element, "android" when
// the manifest does not declare it.
std::string androidPrefix(const pugi::xml_node &root) {
  for (const auto &attr : root.attributes()) {
    const char *name = attr.name();
    if (std::strncmp(name, "xmlns:", 6) == 0 &&
        std::strcmp(attr.value(), ANDROID_NAMESPACE_URI) == 0) {
      return name + 6;
    }
  }
  return "android";
}

class ManifestReader {
public:
  explicit ManifestReader(std::string prefix) : prefix_(std::move(prefix)) {}

  std::string attribute(const pugi::xml_node &node, const char *name) const {
    std::string qualified = prefix_ + ":" + name;
    pugi::xml_attribute attr = node.attribute(qualified.c_str());
    if (!attr) {
      attr = node.attribute(name);
    }
    return attr.value();
  }

  Component component(const pugi::xml_node &node) const {
    Component component;
    component.name = attribute(node, "name");
    for (const auto &filter : node.children("intent-filter")) {
      IntentFilter intent_filter;
      for (const auto &action : filter.children("action")) {
        intent_filter.actions.push_back(attribute(action, "name"));
      }
      for (const auto &category : filter.children("category")) {
        intent_filter.categories.push_back(attribute(category, "name"));
      }
      component.intent_filters.push_back(intent_filter);
    }
    return component;
  }

private:
  std::string prefix_;
};

void formatComponents(std::ostringstream &ss, const char *title,
                      const std::vector<Component> &components) {
  ss << title << " (" << components.size() << "):\n";
  for (const auto &component : components) {
    ss << "  " << component.name << "\n";
    for (const auto &filter : component.intent_filters) {
      for (const auto &action : filter.actions) {
        ss << "    action: " << action << "\n";
      }
      for (const auto &category : filter.categories) {
        ss << "    category: " << category << "\n";
      }
    }
  }
}

} // anonymous namespace

std::string prettyPrintXml(const std::string &xml, const std::string &indent) {
  pugi::xml_document doc;
  parseDecodedXml(doc, xml,
                  pugi::parse_default | pugi::parse_declaration |
                      pugi::parse_comments);

  // the parsed declaration node, if any, is written back as-is
  std::ostringstream out;
  doc.save(out, indent.c_str(),
           pugi::format_indent | pugi::format_no_declaration,
           pugi::encoding_utf8);
  return out.str();
}

ManifestSummary summarizeManifest(const std::string &xml) {
  pugi::xml_document doc;
  parseDecodedXml(doc, xml, pugi::parse_default);

  pugi::xml_node manifest = doc.child("manifest");
  if (!manifest) {
    throw std::runtime_error("XML has no <manifest> root element");
  }

  ManifestReader reader(androidPrefix(manifest));
  ManifestSummary summary;
  summary.package = manifest.attribute("package").value();
  summary.version_code = reader.attribute(manifest, "versionCode");
  summary.version_name = reader.attribute(manifest, "versionName");

  pugi::xml_node uses_sdk = manifest.child("uses-sdk");
  summary.min_sdk = reader.attribute(uses_sdk, "minSdkVersion");
  summary.target_sdk = reader.attribute(uses_sdk, "targetSdkVersion");

  for (const auto &node : manifest.children()) {
    const char *name = node.name();
    if (std::strcmp(name, "uses-permission") == 0 ||
        std::strcmp(name, "uses-permission-sdk-23") == 0 ||
        std::strcmp(name, "permission") == 0 ||
        std::strcmp(name, "permission-tree") == 0 ||
        std::strcmp(name, "permission-group") == 0) {
      summary.permissions.push_back(reader.attribute(node, "name"));
    }
  }

  pugi::xml_node application = manifest.child("application");
  summary.application_name = reader.attribute(application, "name");
  summary.application_label = reader.attribute(application, "label");
  summary.application_icon = reader.attribute(application, "icon");

  for (const auto &node : application.children()) {
    const char *name = node.name();
    if (std::strcmp(name, "activity") == 0 ||
        std::strcmp(name, "activity-alias") == 0) {
      summary.activities.push_back(reader.component(node));
    } else if (std::strcmp(name, "service") == 0) {
      summary.services.push_back(reader.component(node));
    } else if (std::strcmp(name, "receiver") == 0) {
      summary.receivers.push_back(reader.component(node));
    } else if (std::strcmp(name, "provider") == 0) {
      summary.providers.push_back(reader.attribute(node, "name"));
    }
  }

  return summary;
}

std::string formatManifestSummary(const ManifestSummary &summary) {
  std::ostringstream ss;
  ss << "Package: " << summary.package << "\n";
  ss << "Version code: " << summary.version_code << "\n";
  ss << "Version name: " << summary.version_name << "\n";
  ss << "Min SDK: " << summary.min_sdk << "\n";
  ss << "Target SDK: " << summary.target_sdk << "\n";
  ss << "Application: " << summary.application_name << "\n";
  ss << "  label: " << summary.application_label << "\n";
  ss << "  icon: " << summary.application_icon << "\n";

  ss << "Permissions (" << summary.permissions.size() << "):\n";
  for (const auto &permission : summary.permissions) {
    ss << "  " << permission << "\n";
  }

  formatComponents(ss, "Activities", summary.activities);
  formatComponents(ss, "Services", summary.services);
  formatComponents(ss, "Receivers", summary.receivers);

  ss << "Providers (" << summary.providers.size() << "):\n";
  for (const auto &provider : summary.providers) {
    ss << "  " << provider << "\n";
  }
  return ss.str();
}

} // namespace libaxml
