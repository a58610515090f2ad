#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/geometry/geometry_importer.hpp"
#include "internal/util/errors.hpp"

namespace {

using masterplan::geometry::GeometryImporter;
using masterplan::geometry::ImportOptions;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestBadElementIsRecordedNotFatal() {
  const std::string svg = R"(<svg xmlns="http://www.w3.org/2000/svg" viewBox="0 0 400 300">
  <polygon id="unit-a" points="0,0 100,0 100,100 0,100"/>
  <polygon id="unit-b" points="0,0 NaN,0 1,1"/>
</svg>)";

  const auto result = GeometryImporter(ImportOptions{}).Import(svg);
  assert(result.overlays.size() == 1);
  assert(result.errors.size() == 1);
  assert(result.errors[0].element_id() == "unit-b");
  assert(!result.errors[0].message().empty());

  const auto& overlay = result.overlays[0];
  assert(overlay.ref() == "unit-a");
  assert(overlay.overlay_type() == "unit");
  assert(overlay.geometry().has_polygon());
  assert(overlay.label().at("en") == "a");
  assert(overlay.label_position_size() == 2);
  assert(std::fabs(overlay.label_position(0) - 50.0) <= 1.0);
  assert(std::fabs(overlay.label_position(1) - 50.0) <= 1.0);

  assert(result.view_box && *result.view_box == "0 0 400 300");
}

void TestElementsWithoutShapeDataAreRecorded() {
  const std::string svg = R"(<svg>
  <path id="unit-1"/>
  <polygon id="unit-2" points=""/>
  <path id="unit-3" d="M0 0 L10 0 L10 10 Z"/>
  <path id="tree-1"/>
</svg>)";

  ImportOptions options;
  options.id_pattern = "unit-";

  const auto result = GeometryImporter(options).Import(svg);
  assert(result.overlays.size() == 1);
  assert(result.overlays[0].ref() == "unit-3");
  assert(result.errors.size() == 2);
  assert(result.errors[0].element_id() == "unit-1");
  assert(result.errors[0].message().find("no d data") != std::string::npos);
  assert(result.errors[1].element_id() == "unit-2");
  assert(result.errors[1].message().find("no points data") != std::string::npos);
}

void TestPathsKeepTheirDataAndDocumentOrder() {
  const std::string svg = R"(<svg>
  <path id="unit-2" d="M0 0 C0 50 50 50 50 0 Z"/>
  <polyline id="unit-1" points="0,0 10,0 10,10"/>
  <rect id="unit-3" width="5" height="5"/>
</svg>)";

  const auto result = GeometryImporter(ImportOptions{}).Import(svg);
  assert(result.overlays.size() == 2);
  assert(result.overlays[0].ref() == "unit-2");
  assert(result.overlays[0].geometry().path().d() == "M0 0 C0 50 50 50 50 0 Z");
  assert(result.overlays[0].sort_order() == 0);
  assert(result.overlays[1].ref() == "unit-1");
  assert(result.overlays[1].geometry().polygon().points_size() == 3);
  assert(result.overlays[1].sort_order() == 1);
  assert(!result.view_box);
}

void TestIdPatternFiltersElements() {
  const std::string svg = R"(<svg>
  <path id="unit-1" d="M0 0 L10 0 L10 10 Z"/>
  <path id="tree-1" d="M0 0 L10 0 L10 10 Z"/>
  <path id="x-unit-2" d="M0 0 L10 0 L10 10 Z"/>
</svg>)";

  ImportOptions options;
  options.id_pattern   = "unit-";
  options.overlay_type = "zone";

  const auto result = GeometryImporter(options).Import(svg);
  assert(result.overlays.size() == 1);
  assert(result.overlays[0].ref() == "unit-1");
  assert(result.overlays[0].overlay_type() == "zone");
  assert(result.errors.empty());
}

void TestGroupByParentUsesNearestGroupId() {
  const std::string svg = R"(<svg>
  <g id="floor-1">
    <g>
      <path id="unit-1" d="M0 0 L10 0 L10 10 Z"/>
    </g>
    <g id="wing-b">
      <path id="unit-2" d="M0 0 L10 0 L10 10 Z"/>
    </g>
  </g>
  <path id="unit-3" d="M0 0 L10 0 L10 10 Z"/>
</svg>)";

  ImportOptions options;
  options.group_by_parent = true;

  const auto result = GeometryImporter(options).Import(svg);
  assert(result.overlays.size() == 3);
  assert(result.overlays[0].layer() == "floor-1");
  assert(result.overlays[1].layer() == "wing-b");
  assert(result.overlays[2].layer() == "root");

  ImportOptions fixed;
  fixed.layer = "units";
  const auto flat = GeometryImporter(fixed).Import(svg);
  assert(flat.overlays[0].layer() == "units");
}

void TestMissingIdsGetGeneratedRefs() {
  const std::string svg = R"(<svg>
  <path d="M0 0 L10 0 L10 10 Z"/>
  <path id="unit-1" d="M0 0 L10 0 L10 10 Z"/>
  <path d="M0 0 L10 0 L10 10 Z"/>
</svg>)";

  ImportOptions options;
  options.default_locale = "fr";

  const auto result = GeometryImporter(options).Import(svg);
  assert(result.overlays.size() == 3);
  assert(result.overlays[0].ref() == "path-0");
  assert(result.overlays[2].ref() == "path-2");
  assert(result.overlays[0].label().at("fr") == "0");
}

void TestDuplicateRefsAreRejectedPerElement() {
  const std::string svg = R"(<svg>
  <path id="unit-1" d="M0 0 L10 0 L10 10 Z"/>
  <path id="unit-1" d="M5 5 L10 5 L10 10 Z"/>
</svg>)";

  const auto result = GeometryImporter(ImportOptions{}).Import(svg);
  assert(result.overlays.size() == 1);
  assert(result.errors.size() == 1);
  assert(result.errors[0].element_id() == "unit-1");
}

void TestDocumentLevelFailures() {
  using masterplan::util::SourceAssetError;
  using masterplan::util::ValidationError;

  assert(Throws<SourceAssetError>([] { (void)GeometryImporter(ImportOptions{}).Import("<svg><path d='M0 0'"); }));
  assert(Throws<SourceAssetError>([] { (void)GeometryImporter(ImportOptions{}).Import("<html><path d='M0 0 L1 1 Z'/></html>"); }));
  assert(Throws<SourceAssetError>([] { (void)GeometryImporter(ImportOptions{}).Import("<svg><circle r='5'/></svg>"); }));
  assert(Throws<SourceAssetError>([] { (void)GeometryImporter(ImportOptions{}).Import("<svg><path id='a' d='M0 0 L nan 1'/></svg>"); }));

  ImportOptions bad_pattern;
  bad_pattern.id_pattern = "unit-(";
  assert(Throws<ValidationError>([&] { (void)GeometryImporter(bad_pattern).Import("<svg/>"); }));

  ImportOptions bad_precision;
  bad_precision.precision = 0;
  assert(Throws<ValidationError>([&] { (void)GeometryImporter(bad_precision); }));
}

void TestDefaultLabels() {
  assert(GeometryImporter::DefaultLabel("unit-a_12") == "a 12");
  assert(GeometryImporter::DefaultLabel("Zone_North-Wing") == "North Wing");
  assert(GeometryImporter::DefaultLabel("POI-cafe") == "cafe");
  assert(GeometryImporter::DefaultLabel("lobby") == "lobby");
  assert(GeometryImporter::DefaultLabel("unit-") == "unit-");
  assert(GeometryImporter::DefaultLabel("__") == "__");
}

} // namespace

int main() {
  TestBadElementIsRecordedNotFatal();
  TestElementsWithoutShapeDataAreRecorded();
  TestPathsKeepTheirDataAndDocumentOrder();
  TestIdPatternFiltersElements();
  TestGroupByParentUsesNearestGroupId();
  TestMissingIdsGetGeneratedRefs();
  TestDuplicateRefsAreRejectedPerElement();
  TestDocumentLevelFailures();
  TestDefaultLabels();

  std::cout << "masterplan_unit_geometry_importer: pass\n";
  return 0;
}
