// Copyright 2022 Aeva Palecek
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <variant>
#include <string>
#include "glm_common.h"
#include "aabb.h"
#include "transform.h"
#include "errors.h"


enum class ShapeKind : int
{
	Sphere = 0,
	Box,
	Torus,
	Cone,

	// -----------
	Count,
	Invalid = Count
};


struct SphereParams
{
	double Radius = 1.0;
};


struct BoxParams
{
	double Width = 2.0;
	double Height = 2.0;
	double Depth = 2.0;
};


struct TorusParams
{
	double MajorRadius = 0.7;
	double MinorRadius = 0.3;
};


// The apex sits at +Height/2 on the Y axis, and the base disc at -Height/2.
struct ConeParams
{
	double Radius = 1.0;
	double Height = 2.0;
};


// The alternative index of each entry must match its ShapeKind.
using ShapeParams = std::variant<SphereParams, BoxParams, TorusParams, ConeParams>;


const char* ShapeKindName(ShapeKind Kind);
ShapeKind ParseShapeKind(const std::string& Name);


class Shape
{
public:
	Shape();
	explicit Shape(const ShapeParams& InParams);

	ShapeKind Kind() const;
	const char* Name() const;

	const ShapeParams& GetParams() const { return Params; }
	void SetParams(const ShapeParams& InParams);

	const Transform& GetTransform() const { return LocalToWorld; }

	// These return INVALID_SHAPE_CONFIGURATION and change nothing if a scale component is zero.
	StatusCode SetTransform(glm::dvec3 Scale, glm::dvec3 RotationDegrees, glm::dvec3 Translation);
	StatusCode SetScale(glm::dvec3 Scale);
	StatusCode SetRotation(glm::dvec3 RotationDegrees);
	StatusCode SetTranslation(glm::dvec3 Translation);

	// Signed distance in untransformed space.  Negative values are inside.
	double LocalDistance(glm::dvec3 Point) const;

	// Tight axis aligned bounds in untransformed space.
	AABB LocalBounds() const;

	AABB WorldBounds() const;

	double WorldDistance(glm::dvec3 Point) const;

	glm::dvec3 LocalToWorldPoint(glm::dvec3 Point) const;
	glm::dvec3 WorldToLocalPoint(glm::dvec3 Point) const;

private:
	ShapeParams Params;
	Transform LocalToWorld;
};


namespace SDF
{
	Shape Sphere(double Radius);

	Shape Box(double Width, double Height, double Depth);

	Shape Torus(double MajorRadius, double MinorRadius);

	Shape Cone(double Radius, double Height);
}
