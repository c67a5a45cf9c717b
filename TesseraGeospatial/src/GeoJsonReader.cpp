#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/GeoJsonReader.h>
#include <TesseraUtility/ErrorList.h>
#include <TesseraUtility/Result.h>

#include <fmt/format.h>
#include <glm/vec2.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace TesseraUtility;

namespace TesseraGeospatial {

namespace {

using Ring = std::vector<glm::dvec2>;

// GeoJSON positions are [longitude, latitude] or [longitude, latitude, height].
Result<glm::dvec2> parsePosition(const rapidjson::Value& pos) {
  if (!pos.IsArray() || pos.Size() < 2 || pos.Size() > 3) {
    return Result<glm::dvec2>(ErrorList::error(
        "Position value must be an array with two or three members."));
  }

  for (const rapidjson::Value& component : pos.GetArray()) {
    if (!component.IsNumber()) {
      return Result<glm::dvec2>(
          ErrorList::error("Position value must be an array of only numbers."));
    }
  }

  return glm::dvec2(pos[0].GetDouble(), pos[1].GetDouble());
}

Result<Ring> parsePositionArray(const rapidjson::Value& arr) {
  if (!arr.IsArray()) {
    return Result<Ring>(ErrorList::error("Expected an array of positions."));
  }

  Ring points;
  points.reserve(arr.Size());
  for (const rapidjson::Value& value : arr.GetArray()) {
    Result<glm::dvec2> positionResult = parsePosition(value);
    if (!positionResult.value) {
      return Result<Ring>(std::move(positionResult.errors));
    }
    points.emplace_back(*positionResult.value);
  }

  return Result<Ring>(std::move(points));
}

Result<std::vector<Ring>> parseRings(const rapidjson::Value& arr) {
  if (!arr.IsArray()) {
    return Result<std::vector<Ring>>(ErrorList::error(
        "Polygon 'coordinates' member must be an array of position arrays."));
  }

  std::vector<Ring> rings;
  rings.reserve(arr.Size());
  for (const rapidjson::Value& value : arr.GetArray()) {
    Result<Ring> ringResult = parsePositionArray(value);
    if (!ringResult.value) {
      return Result<std::vector<Ring>>(std::move(ringResult.errors));
    }

    const Ring& ring = *ringResult.value;
    if (ring.size() < 4) {
      return Result<std::vector<Ring>>(
          ErrorList::error("Polygon 'coordinates' member must be an array of "
                           "arrays of 4 or more positions."));
    }
    if (ring.front() != ring.back()) {
      return Result<std::vector<Ring>>(ErrorList::error(
          "Polygon 'coordinates' member can only contain closed rings, "
          "requiring the first and last coordinates of each ring to have "
          "identical values."));
    }

    rings.emplace_back(std::move(*ringResult.value));
  }

  return Result<std::vector<Ring>>(std::move(rings));
}

Result<GeoJsonGeometry> parseGeometry(const rapidjson::Value& obj) {
  if (!obj.IsObject()) {
    return Result<GeoJsonGeometry>(
        ErrorList::error("Geometry must be an object."));
  }

  auto typeIt = obj.FindMember("type");
  if (typeIt == obj.MemberEnd() || !typeIt->value.IsString()) {
    return Result<GeoJsonGeometry>(
        ErrorList::error("Geometry must have a string 'type' member."));
  }
  const std::string type = typeIt->value.GetString();

  auto coordinatesIt = obj.FindMember("coordinates");
  if (coordinatesIt == obj.MemberEnd()) {
    return Result<GeoJsonGeometry>(ErrorList::error(
        fmt::format("{} geometry must have a 'coordinates' member.", type)));
  }
  const rapidjson::Value& coordinates = coordinatesIt->value;

  if (type == "Point") {
    Result<glm::dvec2> result = parsePosition(coordinates);
    if (!result.value) {
      return Result<GeoJsonGeometry>(std::move(result.errors));
    }
    return Result<GeoJsonGeometry>(GeoJsonPoint{*result.value});
  }

  if (type == "LineString") {
    Result<Ring> result = parsePositionArray(coordinates);
    if (!result.value) {
      return Result<GeoJsonGeometry>(std::move(result.errors));
    }
    if (result.value->size() < 2) {
      return Result<GeoJsonGeometry>(ErrorList::error(
          "LineString 'coordinates' member must contain two or more "
          "positions."));
    }
    return Result<GeoJsonGeometry>(
        GeoJsonLineString{std::move(*result.value)});
  }

  if (type == "Polygon") {
    Result<std::vector<Ring>> result = parseRings(coordinates);
    if (!result.value) {
      return Result<GeoJsonGeometry>(std::move(result.errors));
    }
    return Result<GeoJsonGeometry>(GeoJsonPolygon{std::move(*result.value)});
  }

  if (type == "MultiPolygon") {
    if (!coordinates.IsArray()) {
      return Result<GeoJsonGeometry>(ErrorList::error(
          "MultiPolygon 'coordinates' member must be an array."));
    }
    GeoJsonMultiPolygon multiPolygon;
    for (const rapidjson::Value& polygon : coordinates.GetArray()) {
      Result<std::vector<Ring>> result = parseRings(polygon);
      if (!result.value) {
        return Result<GeoJsonGeometry>(std::move(result.errors));
      }
      multiPolygon.coordinates.emplace_back(std::move(*result.value));
    }
    return Result<GeoJsonGeometry>(std::move(multiPolygon));
  }

  return Result<GeoJsonGeometry>(ErrorList::error(
      fmt::format("Unsupported geometry type '{}'.", type)));
}

bool isGeometryType(const std::string& type) {
  return type == "Point" || type == "LineString" || type == "Polygon" ||
         type == "MultiPolygon";
}

Result<GeoJsonFeature> parseFeature(const rapidjson::Value& obj) {
  if (!obj.IsObject()) {
    return Result<GeoJsonFeature>(
        ErrorList::error("Feature must be an object."));
  }

  auto typeIt = obj.FindMember("type");
  if (typeIt == obj.MemberEnd() || !typeIt->value.IsString()) {
    return Result<GeoJsonFeature>(
        ErrorList::error("GeoJSON object must have a string 'type' member."));
  }

  const std::string type = typeIt->value.GetString();
  GeoJsonFeature feature;
  ErrorList errors;

  if (isGeometryType(type)) {
    Result<GeoJsonGeometry> geometryResult = parseGeometry(obj);
    if (!geometryResult.value) {
      return Result<GeoJsonFeature>(std::move(geometryResult.errors));
    }
    feature.geometry = std::move(*geometryResult.value);
    return Result<GeoJsonFeature>(std::move(feature));
  }

  if (type != "Feature") {
    return Result<GeoJsonFeature>(ErrorList::error(
        fmt::format("Expected a Feature but found a {}.", type)));
  }

  auto idIt = obj.FindMember("id");
  if (idIt != obj.MemberEnd()) {
    if (idIt->value.IsString()) {
      feature.id = idIt->value.GetString();
    } else if (idIt->value.IsInt64()) {
      feature.id = std::to_string(idIt->value.GetInt64());
    } else if (idIt->value.IsNumber()) {
      feature.id = fmt::format("{}", idIt->value.GetDouble());
    } else {
      errors.emplaceWarning("Feature 'id' must be a string or a number.");
    }
  }

  auto geometryIt = obj.FindMember("geometry");
  if (geometryIt == obj.MemberEnd()) {
    return Result<GeoJsonFeature>(
        ErrorList::error("Feature must have a 'geometry' member."));
  }
  if (!geometryIt->value.IsNull()) {
    Result<GeoJsonGeometry> geometryResult = parseGeometry(geometryIt->value);
    if (!geometryResult.value) {
      return Result<GeoJsonFeature>(std::move(geometryResult.errors));
    }
    feature.geometry = std::move(*geometryResult.value);
  }

  auto propertiesIt = obj.FindMember("properties");
  if (propertiesIt != obj.MemberEnd() && propertiesIt->value.IsObject()) {
    for (const auto& member : propertiesIt->value.GetObject()) {
      const std::string name = member.name.GetString();
      const rapidjson::Value& value = member.value;
      if (value.IsNull()) {
        feature.properties.emplace(name, std::monostate());
      } else if (value.IsBool()) {
        feature.properties.emplace(name, value.GetBool());
      } else if (value.IsNumber()) {
        feature.properties.emplace(name, value.GetDouble());
      } else if (value.IsString()) {
        feature.properties.emplace(name, std::string(value.GetString()));
      } else {
        errors.emplaceWarning(fmt::format(
            "Property '{}' is an object or array and was ignored.",
            name));
      }
    }
  } else if (
      propertiesIt != obj.MemberEnd() && !propertiesIt->value.IsNull()) {
    errors.emplaceWarning("Feature 'properties' must be an object or null.");
  }

  return Result<GeoJsonFeature>(std::move(feature), std::move(errors));
}

Result<rapidjson::Document>
parseDocument(const std::span<const std::byte>& data) {
  rapidjson::Document document;
  document.Parse(reinterpret_cast<const char*>(data.data()), data.size());
  if (document.HasParseError()) {
    return Result<rapidjson::Document>(ErrorList::error(fmt::format(
        "Failed to parse GeoJSON: {} at offset {}",
        rapidjson::GetParseError_En(document.GetParseError()),
        document.GetErrorOffset())));
  }
  return Result<rapidjson::Document>(std::move(document));
}

} // namespace

/*static*/ Result<GeoJsonFeature>
GeoJsonReader::readFeature(const std::span<const std::byte>& data) {
  Result<std::vector<GeoJsonFeature>> collection =
      GeoJsonReader::readFeatureCollection(data);
  if (!collection.value) {
    return Result<GeoJsonFeature>(std::move(collection.errors));
  }

  if (collection.value->size() != 1) {
    collection.errors.emplaceError(fmt::format(
        "Expected exactly one feature but found {}.",
        collection.value->size()));
    return Result<GeoJsonFeature>(std::move(collection.errors));
  }

  return Result<GeoJsonFeature>(
      std::move(collection.value->front()),
      std::move(collection.errors));
}

/*static*/ Result<GeoJsonFeature>
GeoJsonReader::readFeature(std::string_view json) {
  return GeoJsonReader::readFeature(std::span<const std::byte>(
      reinterpret_cast<const std::byte*>(json.data()),
      json.size()));
}

/*static*/ Result<std::vector<GeoJsonFeature>>
GeoJsonReader::readFeatureCollection(const std::span<const std::byte>& data) {
  Result<rapidjson::Document> documentResult = parseDocument(data);
  if (!documentResult.value) {
    return Result<std::vector<GeoJsonFeature>>(
        std::move(documentResult.errors));
  }

  const rapidjson::Document& document = *documentResult.value;
  if (!document.IsObject()) {
    return Result<std::vector<GeoJsonFeature>>(
        ErrorList::error("GeoJSON root must be an object."));
  }

  auto typeIt = document.FindMember("type");
  if (typeIt != document.MemberEnd() && typeIt->value.IsString() &&
      std::string_view(typeIt->value.GetString()) == "FeatureCollection") {
    auto featuresIt = document.FindMember("features");
    if (featuresIt == document.MemberEnd() || !featuresIt->value.IsArray()) {
      return Result<std::vector<GeoJsonFeature>>(ErrorList::error(
          "FeatureCollection must have a 'features' array."));
    }

    std::vector<GeoJsonFeature> features;
    ErrorList errors;
    for (const rapidjson::Value& value : featuresIt->value.GetArray()) {
      Result<GeoJsonFeature> featureResult = parseFeature(value);
      errors.merge(std::move(featureResult.errors));
      if (!featureResult.value) {
        return Result<std::vector<GeoJsonFeature>>(std::move(errors));
      }
      features.emplace_back(std::move(*featureResult.value));
    }
    return Result<std::vector<GeoJsonFeature>>(
        std::move(features),
        std::move(errors));
  }

  Result<GeoJsonFeature> featureResult = parseFeature(document);
  if (!featureResult.value) {
    return Result<std::vector<GeoJsonFeature>>(std::move(featureResult.errors));
  }

  std::vector<GeoJsonFeature> features;
  features.emplace_back(std::move(*featureResult.value));
  return Result<std::vector<GeoJsonFeature>>(
      std::move(features),
      std::move(featureResult.errors));
}

} // namespace TesseraGeospatial
