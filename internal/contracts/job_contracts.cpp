#include "job_contracts.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace pipeline::contracts {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

// Largest integer a JSON number carries exactly; also keeps int64 casts defined.
constexpr double kMaxSafeInteger = 9007199254740991.0;

constexpr std::string_view kGltfConvert      = "gltf.convert";
constexpr std::string_view kTexturePreflight = "texture.preflight";

[[noreturn]] void Fail(const std::string& message) {
  throw util::ContractViolation(message);
}

std::string Trim(std::string_view s) {
  const auto begin = s.find_first_not_of(" \t\r\n\f\v");
  if (begin == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n\f\v");
  return std::string(s.substr(begin, end - begin + 1));
}

const Value* Field(const Struct& record, const char* key) {
  auto it = record.fields().find(key);
  return it == record.fields().end() ? nullptr : &it->second;
}

bool IsRecord(const Value& v) {
  return v.kind_case() == Value::kStructValue;
}

bool IsList(const Value& v) {
  return v.kind_case() == Value::kListValue;
}

bool IsBool(const Value& v) {
  return v.kind_case() == Value::kBoolValue;
}

bool IsString(const Value& v) {
  return v.kind_case() == Value::kStringValue;
}

bool IsNonEmptyString(const Value& v) {
  return IsString(v) && !Trim(v.string_value()).empty();
}

bool IsFiniteNumber(const Value& v) {
  return v.kind_case() == Value::kNumberValue && std::isfinite(v.number_value());
}

bool IsInteger(const Value& v) {
  return IsFiniteNumber(v) && std::trunc(v.number_value()) == v.number_value() &&
         std::fabs(v.number_value()) <= kMaxSafeInteger;
}

bool IsPositiveInteger(const Value& v) {
  return IsInteger(v) && v.number_value() > 0;
}

bool IsNonNegativeInteger(const Value& v) {
  return IsInteger(v) && v.number_value() >= 0;
}

bool IsNonNegativeNumber(const Value& v) {
  return IsFiniteNumber(v) && v.number_value() >= 0;
}

// Non-negative number stored truncated into an int64.
bool IsNonNegativeCount(const Value& v) {
  return IsNonNegativeNumber(v) && v.number_value() <= kMaxSafeInteger;
}

bool IsRotationQuarter(const Value& v) {
  if (!IsInteger(v)) return false;
  const double q = v.number_value();
  return q == 0 || q == 1 || q == 2 || q == 3;
}

std::optional<v1::FaceDirection> ParseDirection(const Value& v) {
  if (!IsString(v)) return std::nullopt;
  const auto& s = v.string_value();
  if (s == "north") return v1::FACE_DIRECTION_NORTH;
  if (s == "east") return v1::FACE_DIRECTION_EAST;
  if (s == "south") return v1::FACE_DIRECTION_SOUTH;
  if (s == "west") return v1::FACE_DIRECTION_WEST;
  if (s == "up") return v1::FACE_DIRECTION_UP;
  if (s == "down") return v1::FACE_DIRECTION_DOWN;
  return std::nullopt;
}

void AssertKnownKeys(const Struct& payload, const std::vector<std::string_view>& allowed, std::string_view kind) {
  std::vector<std::string> unknown;
  for (const auto& [key, _] : payload.fields()) {
    if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) unknown.push_back(key);
  }
  if (unknown.empty()) return;

  // protobuf maps do not keep insertion order
  std::sort(unknown.begin(), unknown.end());
  std::string joined;
  for (const auto& key : unknown) {
    if (!joined.empty()) joined += ", ";
    joined += key;
  }
  Fail("payload has unsupported field(s) for " + std::string(kind) + ": " + joined);
}

const Struct* PayloadRecord(const Value* payload) {
  if (!payload) return nullptr;
  if (!IsRecord(*payload)) Fail("payload must be an object");
  return &payload->struct_value();
}

// ------------------------------------------------------------------
// Payloads
// ------------------------------------------------------------------

void ApplyGltfConvertPayload(const Value* payload, v1::Job* job) {
  const Struct* record = PayloadRecord(payload);
  if (!record) return;

  AssertKnownKeys(*record, {"codecId", "optimize"}, kGltfConvert);

  v1::GltfConvertPayload normalized;
  bool                   any = false;
  if (const Value* codec = Field(*record, "codecId")) {
    if (!IsNonEmptyString(*codec)) Fail("payload.codecId must be a non-empty string");
    normalized.set_codec_id(codec->string_value());
    any = true;
  }
  if (const Value* optimize = Field(*record, "optimize")) {
    if (!IsBool(*optimize)) Fail("payload.optimize must be a boolean");
    normalized.set_optimize(optimize->bool_value());
    any = true;
  }

  if (any) *job->mutable_gltf_convert_payload() = std::move(normalized);
}

void ApplyTexturePreflightPayload(const Value* payload, v1::Job* job) {
  const Struct* record = PayloadRecord(payload);
  if (!record) return;

  AssertKnownKeys(*record, {"textureIds", "maxDimension", "allowNonPowerOfTwo"}, kTexturePreflight);

  v1::TexturePreflightPayload normalized;
  bool                        any = false;
  if (const Value* ids = Field(*record, "textureIds")) {
    if (!IsList(*ids)) Fail("payload.textureIds must be an array of non-empty strings");
    for (const auto& entry : ids->list_value().values()) {
      if (!IsNonEmptyString(entry)) Fail("payload.textureIds must be an array of non-empty strings");
      normalized.add_texture_ids(entry.string_value());
    }
    any = true;
  }
  if (const Value* max_dimension = Field(*record, "maxDimension")) {
    if (!IsPositiveInteger(*max_dimension)) Fail("payload.maxDimension must be a positive integer");
    normalized.set_max_dimension(static_cast<int64_t>(max_dimension->number_value()));
    any = true;
  }
  if (const Value* allow = Field(*record, "allowNonPowerOfTwo")) {
    if (!IsBool(*allow)) Fail("payload.allowNonPowerOfTwo must be a boolean");
    normalized.set_allow_non_power_of_two(allow->bool_value());
    any = true;
  }

  if (any) *job->mutable_texture_preflight_payload() = std::move(normalized);
}

// ------------------------------------------------------------------
// Results
// ------------------------------------------------------------------

void NormalizeCommonResultFields(const Struct& record, v1::JobResult* out) {
  if (const Value* processed_by = Field(record, "processedBy")) {
    if (!IsNonEmptyString(*processed_by)) Fail("result.processedBy must be a non-empty string");
    out->set_processed_by(processed_by->string_value());
  }
  if (const Value* attempt_count = Field(record, "attemptCount")) {
    if (!IsPositiveInteger(*attempt_count)) Fail("result.attemptCount must be a positive integer");
    out->set_attempt_count(static_cast<int64_t>(attempt_count->number_value()));
  }
  if (const Value* finished_at = Field(record, "finishedAt")) {
    if (!IsNonEmptyString(*finished_at)) Fail("result.finishedAt must be a non-empty string");
    out->set_finished_at(finished_at->string_value());
  }
}

void NormalizeTrailingResultFields(const Struct& record, v1::JobResult* out) {
  if (const Value* diagnostics = Field(record, "diagnostics")) {
    if (!IsList(*diagnostics)) Fail("result.diagnostics must be an array of strings");
    for (const auto& entry : diagnostics->list_value().values()) {
      if (!IsString(entry)) Fail("result.diagnostics must be an array of strings");
      out->add_diagnostics(entry.string_value());
    }
  }
  if (const Value* output = Field(record, "output")) {
    if (!IsRecord(*output)) Fail("result.output must be an object");
    *out->mutable_output() = output->struct_value();
  }
}

v1::HierarchyNode ParseHierarchyNode(const Value& value) {
  if (!IsRecord(value)) Fail("result.hierarchy node must be an object");
  const auto& node = value.struct_value();

  const Value* id = Field(node, "id");
  if (!id || !IsNonEmptyString(*id)) Fail("result.hierarchy node.id must be a non-empty string");
  const Value* name = Field(node, "name");
  if (!name || !IsNonEmptyString(*name)) Fail("result.hierarchy node.name must be a non-empty string");

  const Value*  kind = Field(node, "kind");
  v1::NodeKind parsed_kind = v1::NODE_KIND_UNSPECIFIED;
  if (kind && IsString(*kind) && kind->string_value() == "bone") {
    parsed_kind = v1::NODE_KIND_BONE;
  } else if (kind && IsString(*kind) && kind->string_value() == "cube") {
    parsed_kind = v1::NODE_KIND_CUBE;
  } else {
    Fail("result.hierarchy node.kind must be 'bone' or 'cube'");
  }

  const Value* children = Field(node, "children");
  if (!children || !IsList(*children)) Fail("result.hierarchy node.children must be an array");

  v1::HierarchyNode out;
  out.set_id(id->string_value());
  out.set_name(name->string_value());
  out.set_kind(parsed_kind);
  for (const auto& child : children->list_value().values()) {
    *out.add_children() = ParseHierarchyNode(child);
  }
  return out;
}

v1::Animation ParseAnimation(const Value& value, int index) {
  const std::string at = "result.animations[" + std::to_string(index) + "]";
  if (!IsRecord(value)) Fail("result.animations entry must be an object");
  const auto& entry = value.struct_value();

  const Value* id     = Field(entry, "id");
  const Value* name   = Field(entry, "name");
  const Value* length = Field(entry, "length");
  const Value* loop   = Field(entry, "loop");
  if (!id || !IsNonEmptyString(*id)) Fail(at + ".id must be a non-empty string");
  if (!name || !IsNonEmptyString(*name)) Fail(at + ".name must be a non-empty string");
  if (!length || !IsNonNegativeNumber(*length)) Fail(at + ".length must be a non-negative number");
  if (!loop || !IsBool(*loop)) Fail(at + ".loop must be a boolean");

  v1::Animation out;
  out.set_id(id->string_value());
  out.set_name(name->string_value());
  out.set_length(length->number_value());
  out.set_loop(loop->bool_value());
  return out;
}

// Shared face reference fields of texture sources and atlas faces.
struct FaceRef {
  std::string       face_id;
  std::string       cube_id;
  std::string       cube_name;
  v1::FaceDirection direction;
  int32_t           rotation_quarter;
};

FaceRef ParseFaceRef(const Struct& entry, const std::string& at) {
  const Value* face_id   = Field(entry, "faceId");
  const Value* cube_id   = Field(entry, "cubeId");
  const Value* cube_name = Field(entry, "cubeName");
  if (!face_id || !IsNonEmptyString(*face_id)) Fail(at + ".faceId must be a non-empty string");
  if (!cube_id || !IsNonEmptyString(*cube_id)) Fail(at + ".cubeId must be a non-empty string");
  if (!cube_name || !IsNonEmptyString(*cube_name)) Fail(at + ".cubeName must be a non-empty string");

  const Value* direction = Field(entry, "direction");
  auto         parsed    = direction ? ParseDirection(*direction) : std::nullopt;
  if (!parsed) Fail(at + ".direction must be a valid cube face direction");

  return FaceRef{face_id->string_value(), cube_id->string_value(), cube_name->string_value(), *parsed, 0};
}

int32_t ParseRotationQuarter(const Struct& entry, const std::string& at) {
  const Value* rotation = Field(entry, "rotationQuarter");
  if (!rotation || !IsRotationQuarter(*rotation)) Fail(at + ".rotationQuarter must be one of 0, 1, 2, 3");
  return static_cast<int32_t>(rotation->number_value());
}

v1::TextureFaceSource ParseTextureSource(const Value& value, int index) {
  const std::string at = "result.textureSources[" + std::to_string(index) + "]";
  if (!IsRecord(value)) Fail("result.textureSources entry must be an object");
  const auto& entry = value.struct_value();

  auto face = ParseFaceRef(entry, at);

  const Value* color = Field(entry, "colorHex");
  if (!color || !IsNonEmptyString(*color)) Fail(at + ".colorHex must be a non-empty string");
  face.rotation_quarter = ParseRotationQuarter(entry, at);

  v1::TextureFaceSource out;
  out.set_face_id(face.face_id);
  out.set_cube_id(face.cube_id);
  out.set_cube_name(face.cube_name);
  out.set_direction(face.direction);
  out.set_color_hex(color->string_value());
  out.set_rotation_quarter(face.rotation_quarter);
  return out;
}

double FiniteNumber(const Struct& entry, const char* key, const std::string& at) {
  const Value* v = Field(entry, key);
  if (!v || !IsFiniteNumber(*v)) Fail(at + "." + key + " must be a finite number");
  return v->number_value();
}

v1::TextureAtlasFace ParseAtlasFace(const Value& value, const std::string& at) {
  if (!IsRecord(value)) Fail(at + " must be an object");
  const auto& entry = value.struct_value();

  auto face             = ParseFaceRef(entry, at);
  face.rotation_quarter = ParseRotationQuarter(entry, at);

  v1::TextureAtlasFace out;
  out.set_face_id(face.face_id);
  out.set_cube_id(face.cube_id);
  out.set_cube_name(face.cube_name);
  out.set_direction(face.direction);
  out.set_rotation_quarter(face.rotation_quarter);
  out.set_u_min(FiniteNumber(entry, "uMin", at));
  out.set_v_min(FiniteNumber(entry, "vMin", at));
  out.set_u_max(FiniteNumber(entry, "uMax", at));
  out.set_v_max(FiniteNumber(entry, "vMax", at));
  return out;
}

v1::TextureUvEdge ParseUvEdge(const Value& value, const std::string& at) {
  if (!IsRecord(value)) Fail(at + " must be an object");
  const auto& entry = value.struct_value();

  v1::TextureUvEdge out;
  out.set_x1(FiniteNumber(entry, "x1", at));
  out.set_y1(FiniteNumber(entry, "y1", at));
  out.set_x2(FiniteNumber(entry, "x2", at));
  out.set_y2(FiniteNumber(entry, "y2", at));
  return out;
}

v1::TextureAtlas ParseTexture(const Value& value, int index) {
  const std::string at = "result.textures[" + std::to_string(index) + "]";
  if (!IsRecord(value)) Fail("result.textures entry must be an object");
  const auto& entry = value.struct_value();

  const Value* texture_id = Field(entry, "textureId");
  const Value* name       = Field(entry, "name");
  const Value* width      = Field(entry, "width");
  const Value* height     = Field(entry, "height");
  const Value* face_count = Field(entry, "faceCount");
  const Value* image      = Field(entry, "imageDataUrl");
  const Value* faces      = Field(entry, "faces");
  const Value* uv_edges   = Field(entry, "uvEdges");

  if (!texture_id || !IsNonEmptyString(*texture_id)) Fail(at + ".textureId must be a non-empty string");
  if (!name || !IsNonEmptyString(*name)) Fail(at + ".name must be a non-empty string");
  if (!width || !IsNonNegativeCount(*width)) Fail(at + ".width must be a non-negative number");
  if (!height || !IsNonNegativeCount(*height)) Fail(at + ".height must be a non-negative number");
  if (!face_count || !IsNonNegativeCount(*face_count)) Fail(at + ".faceCount must be a non-negative number");
  if (!image || !IsNonEmptyString(*image)) Fail(at + ".imageDataUrl must be a non-empty string");
  if (!faces || !IsList(*faces)) Fail(at + ".faces must be an array");
  if (!uv_edges || !IsList(*uv_edges)) Fail(at + ".uvEdges must be an array");

  v1::TextureAtlas out;
  out.set_texture_id(texture_id->string_value());
  out.set_name(name->string_value());
  out.set_width(static_cast<int64_t>(width->number_value()));
  out.set_height(static_cast<int64_t>(height->number_value()));
  out.set_face_count(static_cast<int64_t>(face_count->number_value()));
  out.set_image_data_url(image->string_value());

  int face_index = 0;
  for (const auto& face : faces->list_value().values()) {
    *out.add_faces() = ParseAtlasFace(face, at + ".faces[" + std::to_string(face_index++) + "]");
  }
  int edge_index = 0;
  for (const auto& edge : uv_edges->list_value().values()) {
    *out.add_uv_edges() = ParseUvEdge(edge, at + ".uvEdges[" + std::to_string(edge_index++) + "]");
  }
  return out;
}

template <typename T, typename ParseFn>
void ParseIndexedList(const Value& list, const char* path, ParseFn parse, google::protobuf::RepeatedPtrField<T>* out) {
  if (!IsList(list)) Fail(std::string(path) + " must be an array");
  int index = 0;
  for (const auto& entry : list.list_value().values()) {
    *out->Add() = parse(entry, index++);
  }
}

v1::JobResult NormalizeGltfConvertResult(const Struct& record) {
  const Value* kind = Field(record, "kind");
  if (!kind || !IsString(*kind) || kind->string_value() != kGltfConvert) Fail("result.kind must be 'gltf.convert'");

  v1::JobResult out;
  out.set_kind(v1::JOB_KIND_GLTF_CONVERT);
  NormalizeCommonResultFields(record, &out);

  if (const Value* status = Field(record, "status")) {
    const bool ok = IsString(*status) &&
                    (status->string_value() == "converted" || status->string_value() == "noop" || status->string_value() == "failed");
    if (!ok) Fail("result.status must be one of: converted, noop, failed");
    out.set_status(status->string_value());
  }

  auto* detail = out.mutable_gltf_convert();

  if (const Value* has_geometry = Field(record, "hasGeometry")) {
    if (!IsBool(*has_geometry)) Fail("result.hasGeometry must be a boolean");
    detail->set_has_geometry(has_geometry->bool_value());
  }

  if (const Value* delta = Field(record, "geometryDelta")) {
    if (!IsRecord(*delta)) Fail("result.geometryDelta must be an object");
    auto* out_delta = detail->mutable_geometry_delta();
    if (const Value* bones = Field(delta->struct_value(), "bones")) {
      if (!IsInteger(*bones)) Fail("result.geometryDelta.bones must be an integer");
      out_delta->set_bones(static_cast<int64_t>(bones->number_value()));
    }
    if (const Value* cubes = Field(delta->struct_value(), "cubes")) {
      if (!IsInteger(*cubes)) Fail("result.geometryDelta.cubes must be an integer");
      out_delta->set_cubes(static_cast<int64_t>(cubes->number_value()));
    }
  }

  if (const Value* hierarchy = Field(record, "hierarchy")) {
    if (!IsList(*hierarchy)) Fail("result.hierarchy must be an array");
    auto* nodes = detail->mutable_hierarchy();
    for (const auto& entry : hierarchy->list_value().values()) {
      *nodes->add_nodes() = ParseHierarchyNode(entry);
    }
  }

  if (const Value* animations = Field(record, "animations")) {
    ParseIndexedList(*animations, "result.animations", ParseAnimation, detail->mutable_animations());
  }
  if (const Value* sources = Field(record, "textureSources")) {
    ParseIndexedList(*sources, "result.textureSources", ParseTextureSource, detail->mutable_texture_sources());
  }
  if (const Value* textures = Field(record, "textures")) {
    ParseIndexedList(*textures, "result.textures", ParseTexture, detail->mutable_textures());
  }

  NormalizeTrailingResultFields(record, &out);
  return out;
}

int64_t SummaryCount(const Struct& summary, const char* key) {
  const Value* v = Field(summary, key);
  if (!v || !IsNonNegativeInteger(*v)) Fail(std::string("result.summary.") + key + " must be a non-negative integer");
  return static_cast<int64_t>(v->number_value());
}

v1::JobResult NormalizeTexturePreflightResult(const Struct& record) {
  const Value* kind = Field(record, "kind");
  if (!kind || !IsString(*kind) || kind->string_value() != kTexturePreflight) Fail("result.kind must be 'texture.preflight'");

  v1::JobResult out;
  out.set_kind(v1::JOB_KIND_TEXTURE_PREFLIGHT);
  NormalizeCommonResultFields(record, &out);

  if (const Value* status = Field(record, "status")) {
    const bool ok = IsString(*status) && (status->string_value() == "passed" || status->string_value() == "failed");
    if (!ok) Fail("result.status must be one of: passed, failed");
    out.set_status(status->string_value());
  }

  auto* detail = out.mutable_texture_preflight();
  if (const Value* summary = Field(record, "summary")) {
    if (!IsRecord(*summary)) Fail("result.summary must be an object");
    auto* out_summary = detail->mutable_summary();
    out_summary->set_checked(SummaryCount(summary->struct_value(), "checked"));
    out_summary->set_oversized(SummaryCount(summary->struct_value(), "oversized"));
    out_summary->set_non_power_of_two(SummaryCount(summary->struct_value(), "nonPowerOfTwo"));
  }

  NormalizeTrailingResultFields(record, &out);
  return out;
}

} // namespace

std::string_view KindName(v1::JobKind kind) {
  switch (kind) {
    case v1::JOB_KIND_GLTF_CONVERT:
      return kGltfConvert;
    case v1::JOB_KIND_TEXTURE_PREFLIGHT:
      return kTexturePreflight;
    default:
      return {};
  }
}

std::string NormalizeProjectId(const std::string& project_id) {
  auto trimmed = Trim(project_id);
  if (trimmed.empty()) Fail("projectId is required");
  return trimmed;
}

std::optional<v1::JobKind> ParseKind(std::string_view name) {
  if (name == kGltfConvert) return v1::JOB_KIND_GLTF_CONVERT;
  if (name == kTexturePreflight) return v1::JOB_KIND_TEXTURE_PREFLIGHT;
  return std::nullopt;
}

v1::JobKind NormalizeJobKind(const std::optional<std::string>& kind) {
  const std::string trimmed = kind ? Trim(*kind) : std::string{};
  if (trimmed.empty()) Fail("kind is required");

  auto parsed = ParseKind(trimmed);
  if (!parsed) {
    Fail("kind must be one of: " + std::string(kGltfConvert) + ", " + std::string(kTexturePreflight));
  }
  return *parsed;
}

void ApplyJobPayload(v1::JobKind kind, const Value* payload, v1::Job* job) {
  job->clear_payload();
  if (kind == v1::JOB_KIND_GLTF_CONVERT) {
    ApplyGltfConvertPayload(payload, job);
    return;
  }
  ApplyTexturePreflightPayload(payload, job);
}

std::optional<v1::JobResult> NormalizeJobResult(v1::JobKind kind, const Value* result) {
  if (!result) return std::nullopt;
  if (!IsRecord(*result)) Fail("result must be an object");

  if (kind == v1::JOB_KIND_GLTF_CONVERT) {
    return NormalizeGltfConvertResult(result->struct_value());
  }
  return NormalizeTexturePreflightResult(result->struct_value());
}

int64_t ClampInteger(std::optional<double> value, int64_t min, int64_t max, int64_t fallback) {
  if (!value || !std::isfinite(*value)) return fallback;
  const double truncated = std::trunc(*value);
  if (truncated < static_cast<double>(min)) return min;
  if (truncated > static_cast<double>(max)) return max;
  return static_cast<int64_t>(truncated);
}

} // namespace pipeline::contracts
