/*
 * Copyright (c) 2024-2026, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-FileCopyrightText: Copyright (c) 2024-2026, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/*-------------------------------------------------------------------------------------------------
# Property animation types

Types shared by the EXT_property_animation decoder: value shapes, interpolation modes,
keyframes and tracks, the resolved target of a channel and the error reported by
every fallible step.
-------------------------------------------------------------------------------------------------*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#define EXT_PROPERTY_ANIMATION_EXTENSION_NAME "EXT_property_animation"

namespace propanim {

// Shape of the animated value, selects how many floats make one sample
enum class ValueType : uint8_t
{
  eNone,  // Not declared (yet)
  eFloat,
  eVector2,
  eVector3,
  eQuaternion,
  eColor3,
  eColor4,  // Decoded as a Color3 track plus a separate alpha track
};

enum class Interpolation : uint8_t
{
  eStep,
  eLinear,
  eCubicSpline,
};

// Colors are carried as glm::vec3, the alpha of a Color4 goes to its own float track
using AnimationValue = std::variant<float, glm::vec2, glm::vec3, glm::quat>;

struct Keyframe
{
  float                         frame = 0.0f;  // Copied verbatim from the sampler input
  AnimationValue                value;
  std::optional<AnimationValue> inTangent;   // CUBICSPLINE only
  std::optional<AnimationValue> outTangent;  // CUBICSPLINE only
};

struct KeyframeTrack
{
  std::string           name;
  std::string           targetPath;                         // Dotted sub-property path on the target object
  ValueType             valueType     = ValueType::eFloat;  // Playback type of the keys
  Interpolation         interpolation = Interpolation::eLinear;
  std::vector<Keyframe> keys;
};

// Scene object animated by a channel
struct TargetObject
{
  enum Type : uint8_t
  {
    eNone,
    eMaterial,
    eLight,
  };

  Type type  = eNone;
  int  index = -1;  // Index into model.materials or model.lights
  int  node  = -1;  // Node instancing the light, -1 for materials

  bool valid() const { return type != eNone; }
  bool operator==(const TargetObject&) const = default;
};

struct TargetDescriptor
{
  std::string  targetPath;
  ValueType    valueType = ValueType::eNone;
  TargetObject object;
};

enum class ErrorCode : uint8_t
{
  eMalformedAnimation,  // Invalid sampler interpolation, sampler index or channel entry
  eInvalidTargetPath,   // Unknown segment, missing or unresolvable index
  eAccessorRange,       // Output buffer shorter than the keyframes require
  eAccessorRead,        // Accessor could not be read from the asset
};

struct AnimationError
{
  ErrorCode   code = ErrorCode::eMalformedAnimation;
  std::string message;
};

// Returns the interpolation for a glTF sampler string, empty string is LINEAR
std::optional<Interpolation> parseInterpolation(std::string_view name);

std::string_view toString(ValueType type);
std::string_view toString(Interpolation interpolation);
std::string_view toString(ErrorCode code);
std::string_view toString(TargetObject::Type type);

}  // namespace propanim
