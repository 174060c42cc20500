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

#include "property_animation_types.hpp"

namespace propanim {

std::optional<Interpolation> parseInterpolation(std::string_view name)
{
  if(name.empty() || name == "LINEAR")
    return Interpolation::eLinear;
  if(name == "STEP")
    return Interpolation::eStep;
  if(name == "CUBICSPLINE")
    return Interpolation::eCubicSpline;
  return std::nullopt;
}

std::string_view toString(ValueType type)
{
  switch(type)
  {
    case ValueType::eNone:
      return "none";
    case ValueType::eFloat:
      return "float";
    case ValueType::eVector2:
      return "vec2";
    case ValueType::eVector3:
      return "vec3";
    case ValueType::eQuaternion:
      return "quat";
    case ValueType::eColor3:
      return "color3";
    case ValueType::eColor4:
      return "color4";
  }
  return "unknown";
}

std::string_view toString(Interpolation interpolation)
{
  switch(interpolation)
  {
    case Interpolation::eStep:
      return "STEP";
    case Interpolation::eLinear:
      return "LINEAR";
    case Interpolation::eCubicSpline:
      return "CUBICSPLINE";
  }
  return "unknown";
}

std::string_view toString(ErrorCode code)
{
  switch(code)
  {
    case ErrorCode::eMalformedAnimation:
      return "MalformedAnimation";
    case ErrorCode::eInvalidTargetPath:
      return "InvalidTargetPath";
    case ErrorCode::eAccessorRange:
      return "AccessorRangeError";
    case ErrorCode::eAccessorRead:
      return "AccessorReadError";
  }
  return "unknown";
}

std::string_view toString(TargetObject::Type type)
{
  switch(type)
  {
    case TargetObject::eNone:
      return "none";
    case TargetObject::eMaterial:
      return "material";
    case TargetObject::eLight:
      return "light";
  }
  return "unknown";
}

}  // namespace propanim
