#include "DXFWriter.hpp"
#include <iostream>
#include <stdexcept>

namespace PlateTrace {

namespace {
const char* const kPlateLayer = "Plate";
}

DXFWriter::DXFWriter(dxfRW& dxfWriter, double pixelsPerUnit)
    : m_dxfWriter(dxfWriter), m_pixelsPerUnit(pixelsPerUnit) {
    if (pixelsPerUnit <= 0.0) {
        throw std::invalid_argument("pixelsPerUnit must be positive");
    }
}

void DXFWriter::addPolygon(const Polygon& polygon) {
    DRW_LWPolyline polyline;
    polyline.layer = kPlateLayer;
    polyline.color = 256; // By layer
    polyline.flags = 1;   // Closed polyline
    polyline.elevation = 0.0;
    polyline.thickness = 0.0;

    for (const auto& point : polygon) {
        DRW_Vertex2D vertex;
        vertex.x = static_cast<double>(point.x) / m_pixelsPerUnit;
        vertex.y = -static_cast<double>(point.y) / m_pixelsPerUnit;
        vertex.bulge = 0.0;
        polyline.addVertex(vertex);
    }

    m_polylines.push_back(polyline);
}

void DXFWriter::addLWPolyline(const DRW_LWPolyline& data) {
    m_polylines.push_back(data);
}

void DXFWriter::writeLayers() {
    DRW_Layer layer;
    layer.name = kPlateLayer;
    layer.color = 3; // Green, as annotated
    if (!m_dxfWriter.writeLayer(&layer)) {
        std::cerr << "[ERROR] Failed to write layer " << kPlateLayer << " to DXF." << std::endl;
    }
}

void DXFWriter::writeEntities() {
    for (auto& polyline : m_polylines) {
        if (!m_dxfWriter.writeLWPolyline(&polyline)) {
            std::cerr << "[ERROR] Failed to write LWPolyline to DXF." << std::endl;
        }
    }
    m_polylines.clear();
}

bool DXFWriter::savePolygonAsDXF(const Polygon& polygon, double pixelsPerUnit, const std::string& outputPath) {
    if (polygon.vertexCount() < 2) {
        std::cerr << "[ERROR] Polygon needs at least 2 vertices for DXF export" << std::endl;
        return false;
    }

    try {
        dxfRW dxf(outputPath.c_str());
        DXFWriter writer(dxf, pixelsPerUnit);
        writer.addPolygon(polygon);

        if (!dxf.write(&writer, DRW::Version::AC1015, false)) {
            std::cerr << "[ERROR] Failed to write DXF file: " << outputPath << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Exception while saving DXF: " << e.what() << std::endl;
        return false;
    }
}

} // namespace PlateTrace
