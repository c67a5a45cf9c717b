#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/GeoJsonWriter.h>

#include <glm/vec2.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TesseraGeospatial {

namespace {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

void writeString(Writer& writer, std::string_view value) {
  writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void writeKey(Writer& writer, std::string_view key) {
  writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
}

void writePosition(Writer& writer, const glm::dvec2& position) {
  writer.StartArray();
  writer.Double(position.x);
  writer.Double(position.y);
  writer.EndArray();
}

void writeRing(Writer& writer, const std::vector<glm::dvec2>& ring) {
  writer.StartArray();
  for (const glm::dvec2& position : ring) {
    writePosition(writer, position);
  }
  writer.EndArray();
}

void writeRings(
    Writer& writer,
    const std::vector<std::vector<glm::dvec2>>& rings) {
  writer.StartArray();
  for (const std::vector<glm::dvec2>& ring : rings) {
    writeRing(writer, ring);
  }
  writer.EndArray();
}

struct GeometryWriter {
  Writer& writer;

  void operator()(const GeoJsonPoint& point) {
    writeString(writer, "Point");
    writeKey(writer, "coordinates");
    writePosition(writer, point.coordinates);
  }

  void operator()(const GeoJsonLineString& line) {
    writeString(writer, "LineString");
    writeKey(writer, "coordinates");
    writeRing(writer, line.coordinates);
  }

  void operator()(const GeoJsonPolygon& polygon) {
    writeString(writer, "Polygon");
    writeKey(writer, "coordinates");
    writeRings(writer, polygon.coordinates);
  }

  void operator()(const GeoJsonMultiPolygon& multiPolygon) {
    writeString(writer, "MultiPolygon");
    writeKey(writer, "coordinates");
    writer.StartArray();
    for (const auto& polygon : multiPolygon.coordinates) {
      writeRings(writer, polygon);
    }
    writer.EndArray();
  }
};

struct PropertyWriter {
  Writer& writer;

  void operator()(std::monostate) { writer.Null(); }
  void operator()(bool value) { writer.Bool(value); }
  void operator()(double value) { writer.Double(value); }
  void operator()(const std::string& value) { writeString(writer, value); }
};

void writeFeatureObject(Writer& writer, const GeoJsonFeature& feature) {
  writer.StartObject();
  writeKey(writer, "type");
  writeString(writer, "Feature");

  if (feature.id) {
    writeKey(writer, "id");
    writeString(writer, *feature.id);
  }

  writeKey(writer, "geometry");
  if (feature.geometry) {
    writer.StartObject();
    writeKey(writer, "type");
    std::visit(GeometryWriter{writer}, *feature.geometry);
    writer.EndObject();
  } else {
    writer.Null();
  }

  writeKey(writer, "properties");
  writer.StartObject();
  for (const auto& [name, value] : feature.properties) {
    writeKey(writer, name);
    std::visit(PropertyWriter{writer}, value);
  }
  writer.EndObject();

  writer.EndObject();
}

} // namespace

/*static*/ std::string
GeoJsonWriter::writeFeature(const GeoJsonFeature& feature) {
  rapidjson::StringBuffer buffer;
  Writer writer(buffer);
  writeFeatureObject(writer, feature);
  return std::string(buffer.GetString(), buffer.GetSize());
}

/*static*/ std::string GeoJsonWriter::writeFeatureCollection(
    const std::vector<GeoJsonFeature>& features) {
  rapidjson::StringBuffer buffer;
  Writer writer(buffer);

  writer.StartObject();
  writeKey(writer, "type");
  writeString(writer, "FeatureCollection");
  writeKey(writer, "features");
  writer.StartArray();
  for (const GeoJsonFeature& feature : features) {
    writeFeatureObject(writer, feature);
  }
  writer.EndArray();
  writer.EndObject();

  return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace TesseraGeospatial
