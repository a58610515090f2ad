#include "geometry_importer.hpp"

#include <tinyxml2.h>

#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <utility>

#include "internal/geometry/geometry.hpp"
#include "internal/geometry/path_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::geometry {

namespace v1 = masterplan::release::v1;

namespace {

// "svg:path" → "path"
std::string_view LocalName(const char* name) {
  std::string_view view(name ? name : "");
  const auto       colon = view.rfind(':');
  return colon == std::string_view::npos ? view : view.substr(colon + 1);
}

std::optional<std::string> ViewBoxOf(const tinyxml2::XMLElement& root) {
  for (const auto* attr = root.FirstAttribute(); attr; attr = attr->Next()) {
    std::string name = attr->Name();
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "viewbox" && attr->Value() && *attr->Value()) {
      return std::string(attr->Value());
    }
  }
  return std::nullopt;
}

struct Walker {
  const ImportOptions&      options;
  const std::regex*         filter;
  ImportResult&             result;
  std::set<std::string>     seen;
  int                       element_index = 0;

  void Visit(const tinyxml2::XMLElement& element, const std::string& group) {
    for (const auto* child = element.FirstChildElement(); child; child = child->NextSiblingElement()) {
      const auto name = LocalName(child->Name());
      if (name == "g") {
        const char* id = child->Attribute("id");
        Visit(*child, id && *id ? std::string(id) : group);
      } else if (name == "path" || name == "polygon" || name == "polyline") {
        Element(*child, name, group);
      } else {
        Visit(*child, group);
      }
    }
  }

  void Element(const tinyxml2::XMLElement& element, std::string_view name, const std::string& group) {
    const char* attr_name = name == "path" ? "d" : "points";
    const char* attr      = element.Attribute(attr_name);

    const char* raw_id = element.Attribute("id");
    std::string id     = raw_id ? raw_id : "";
    if (filter && !std::regex_search(id, *filter, std::regex_constants::match_continuous)) {
      return;
    }
    if (id.empty()) {
      id = "path-" + std::to_string(element_index);
    }
    ++element_index;

    try {
      if (!attr || !*attr) {
        throw util::GeometryError("<" + std::string(name) + "> has no " + attr_name + " data");
      }
      Geometry shape = name == "path" ? Geometry{PathShape{attr}} : Geometry{PolygonShape{ParsePointList(attr)}};
      const GeometryPath path = Analyze(shape, options.curve_tolerance, options.precision);

      if (!seen.insert(id).second) {
        throw util::GeometryError("duplicate " + options.overlay_type + " ref '" + id + "'");
      }

      v1::ReleaseOverlay overlay;
      overlay.set_ref(id);
      overlay.set_overlay_type(options.overlay_type);
      *overlay.mutable_geometry() = ToProto(shape);
      (*overlay.mutable_label())[options.default_locale] = GeometryImporter::DefaultLabel(id);
      overlay.add_label_position(path.anchor.x);
      overlay.add_label_position(path.anchor.y);
      overlay.set_layer(options.group_by_parent ? group : options.layer);
      overlay.set_sort_order(static_cast<int32_t>(result.overlays.size()));
      result.overlays.push_back(std::move(overlay));
    } catch (const util::GeometryError& e) {
      v1::GeometryIssue issue;
      issue.set_element_id(id);
      issue.set_message(e.what());
      result.errors.push_back(std::move(issue));
      MASTERPLAN_LOG_DEBUG("skipped svg element", {observability::StringField("element_id", id), observability::StringField("error", e.what())});
    }
  }
};

} // namespace

GeometryImporter::GeometryImporter(ImportOptions options) : options_(std::move(options)) {
  if (!(options_.precision > 0.0)) {
    throw util::ValidationError("label precision must be positive");
  }
  if (!(options_.curve_tolerance > 0.0)) {
    throw util::ValidationError("curve tolerance must be positive");
  }
  if (options_.overlay_type.empty()) {
    throw util::ValidationError("overlay type is required");
  }
}

ImportResult GeometryImporter::Import(std::string_view document) const {
  std::optional<std::regex> filter;
  if (!options_.id_pattern.empty()) {
    try {
      filter.emplace(options_.id_pattern);
    } catch (const std::regex_error& e) {
      throw util::ValidationError("invalid id pattern '" + options_.id_pattern + "': " + e.what());
    }
  }

  tinyxml2::XMLDocument doc;
  if (doc.Parse(document.data(), document.size()) != tinyxml2::XML_SUCCESS) {
    throw util::SourceAssetError(std::string("malformed svg document: ") + doc.ErrorStr());
  }
  const auto* root = doc.RootElement();
  if (!root || LocalName(root->Name()) != "svg") {
    throw util::SourceAssetError("document root is not <svg>");
  }

  ImportResult result;
  result.view_box = ViewBoxOf(*root);

  Walker walker{options_, filter ? &*filter : nullptr, result, {}, 0};
  walker.Visit(*root, "root");

  if (result.overlays.empty()) {
    throw util::SourceAssetError("no importable geometry (" + std::to_string(result.errors.size()) + " elements rejected)");
  }

  MASTERPLAN_LOG_INFO("svg imported", {observability::IntField("overlays", static_cast<int64_t>(result.overlays.size())),
                                       observability::IntField("rejected", static_cast<int64_t>(result.errors.size()))});
  return result;
}

std::string GeometryImporter::DefaultLabel(const std::string& id) {
  static const std::regex kPrefix("^(unit|zone|poi|path)-?", std::regex_constants::icase);
  static const std::regex kSeparators("[_-]+");

  std::string label = std::regex_replace(id, kPrefix, "", std::regex_constants::format_first_only);
  label             = std::regex_replace(label, kSeparators, " ");

  const auto first = label.find_first_not_of(' ');
  if (first == std::string::npos) {
    return id;
  }
  const auto last = label.find_last_not_of(' ');
  return label.substr(first, last - first + 1);
}

} // namespace masterplan::geometry
