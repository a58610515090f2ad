#include "dzi.hpp"

#include <tinyxml2.h>

namespace masterplan::tiling {

std::string BuildDziDescriptor(const TilePyramid& pyramid) {
  tinyxml2::XMLDocument doc;
  doc.InsertEndChild(doc.NewDeclaration());

  auto* image = doc.NewElement("Image");
  image->SetAttribute("TileSize", pyramid.plan.tile_size);
  image->SetAttribute("Overlap", pyramid.plan.overlap);
  image->SetAttribute("Format", pyramid.Extension().c_str());
  image->SetAttribute("xmlns", "http://schemas.microsoft.com/deepzoom/2008");
  doc.InsertEndChild(image);

  auto* size = doc.NewElement("Size");
  size->SetAttribute("Width", pyramid.plan.width);
  size->SetAttribute("Height", pyramid.plan.height);
  image->InsertEndChild(size);

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return printer.CStr();
}

} // namespace masterplan::tiling
