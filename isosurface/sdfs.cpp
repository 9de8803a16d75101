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

#include <algorithm>
#include <array>
#include <cmath>
#include <type_traits>
#include "sdfs.h"


using namespace glm;


// Distance functions follow https://iquilezles.org/articles/distfunctions/
namespace SDF
{
	double SphereDist(const ShapeParams& Params, dvec3 Point)
	{
		const SphereParams& Sphere = std::get<SphereParams>(Params);
		return length(Point) - Sphere.Radius;
	}

	AABB SphereBounds(const ShapeParams& Params)
	{
		const double Radius = std::get<SphereParams>(Params).Radius;
		return {
			dvec3(-Radius),
			dvec3(Radius)
		};
	}

	double BoxDist(const ShapeParams& Params, dvec3 Point)
	{
		const BoxParams& Box = std::get<BoxParams>(Params);
		const dvec3 HalfExtent = dvec3(Box.Width, Box.Height, Box.Depth) * 0.5;
		const dvec3 Q = abs(Point) - HalfExtent;
		return length(max(Q, dvec3(0.0))) + std::min(max(Q.x, Q.y, Q.z), 0.0);
	}

	AABB BoxBounds(const ShapeParams& Params)
	{
		const BoxParams& Box = std::get<BoxParams>(Params);
		const dvec3 HalfExtent = dvec3(Box.Width, Box.Height, Box.Depth) * 0.5;
		return {
			-HalfExtent,
			HalfExtent
		};
	}

	double TorusDist(const ShapeParams& Params, dvec3 Point)
	{
		const TorusParams& Torus = std::get<TorusParams>(Params);
		const dvec2 Q = dvec2(length(dvec2(Point.x, Point.z)) - Torus.MajorRadius, Point.y);
		return length(Q) - Torus.MinorRadius;
	}

	AABB TorusBounds(const ShapeParams& Params)
	{
		const TorusParams& Torus = std::get<TorusParams>(Params);
		const double HalfWidth = Torus.MajorRadius + Torus.MinorRadius;
		const double HalfHeight = Torus.MinorRadius;
		return {
			dvec3(-HalfWidth, -HalfHeight, -HalfWidth),
			dvec3(HalfWidth, HalfHeight, HalfWidth)
		};
	}

	double ConeDist(const ShapeParams& Params, dvec3 Point)
	{
		const ConeParams& Cone = std::get<ConeParams>(Params);

		// Profile of the cone in (radial, height) space, measured from the apex.
		const dvec2 Q = dvec2(Cone.Radius, -Cone.Height);
		const dvec2 W = dvec2(length(dvec2(Point.x, Point.z)), Point.y - Cone.Height * 0.5);

		const dvec2 A = W - Q * clamp(dot(W, Q) / dot(Q, Q), 0.0, 1.0);
		const dvec2 B = W - Q * dvec2(clamp(W.x / Q.x, 0.0, 1.0), 1.0);
		const double K = sign(Q.y);
		const double Dist = std::min(dot(A, A), dot(B, B));
		const double Side = std::max(K * (W.x * Q.y - W.y * Q.x), K * (W.y - Q.y));
		return std::sqrt(Dist) * sign(Side);
	}

	AABB ConeBounds(const ShapeParams& Params)
	{
		const ConeParams& Cone = std::get<ConeParams>(Params);
		const double HalfHeight = Cone.Height * 0.5;
		return {
			dvec3(-Cone.Radius, -HalfHeight, -Cone.Radius),
			dvec3(Cone.Radius, HalfHeight, Cone.Radius)
		};
	}
}


struct ShapeDispatch
{
	const char* Name;
	double (*LocalDistance)(const ShapeParams& Params, dvec3 Point);
	AABB (*LocalBounds)(const ShapeParams& Params);
};


static const std::array<ShapeDispatch, size_t(ShapeKind::Count)> ShapeTable =
{{
	{ "sphere", SDF::SphereDist, SDF::SphereBounds },
	{ "box", SDF::BoxDist, SDF::BoxBounds },
	{ "torus", SDF::TorusDist, SDF::TorusBounds },
	{ "cone", SDF::ConeDist, SDF::ConeBounds }
}};


static_assert(std::variant_size_v<ShapeParams> == size_t(ShapeKind::Count),
	"Every shape kind needs exactly one parameter block.");

static_assert(std::is_same_v<std::variant_alternative_t<size_t(ShapeKind::Cone), ShapeParams>, ConeParams>,
	"Parameter blocks must be declared in ShapeKind order.");


const char* ShapeKindName(ShapeKind Kind)
{
	if (Kind < ShapeKind::Count)
	{
		return ShapeTable[size_t(Kind)].Name;
	}
	return "invalid";
}


ShapeKind ParseShapeKind(const std::string& Name)
{
	for (size_t Index = 0; Index < ShapeTable.size(); ++Index)
	{
		if (Name == ShapeTable[Index].Name)
		{
			return ShapeKind(Index);
		}
	}
	return ShapeKind::Invalid;
}


Shape::Shape()
	: Params(SphereParams())
{
}


Shape::Shape(const ShapeParams& InParams)
	: Params(InParams)
{
}


ShapeKind Shape::Kind() const
{
	return ShapeKind(Params.index());
}


const char* Shape::Name() const
{
	return ShapeKindName(Kind());
}


void Shape::SetParams(const ShapeParams& InParams)
{
	Params = InParams;
}


StatusCode Shape::SetTransform(dvec3 Scale, dvec3 RotationDegrees, dvec3 Translation)
{
	return LocalToWorld.Set(Scale, RotationDegrees, Translation);
}


StatusCode Shape::SetScale(dvec3 Scale)
{
	return LocalToWorld.SetScale(Scale);
}


StatusCode Shape::SetRotation(dvec3 RotationDegrees)
{
	return LocalToWorld.SetRotation(RotationDegrees);
}


StatusCode Shape::SetTranslation(dvec3 Translation)
{
	return LocalToWorld.SetTranslation(Translation);
}


double Shape::LocalDistance(dvec3 Point) const
{
	return ShapeTable[Params.index()].LocalDistance(Params, Point);
}


AABB Shape::LocalBounds() const
{
	return ShapeTable[Params.index()].LocalBounds(Params);
}


AABB Shape::WorldBounds() const
{
	return LocalToWorld.Apply(LocalBounds());
}


double Shape::WorldDistance(dvec3 Point) const
{
	return LocalDistance(LocalToWorld.ApplyInv(Point));
}


dvec3 Shape::LocalToWorldPoint(dvec3 Point) const
{
	return LocalToWorld.Apply(Point);
}


dvec3 Shape::WorldToLocalPoint(dvec3 Point) const
{
	return LocalToWorld.ApplyInv(Point);
}


namespace SDF
{
	Shape Sphere(double Radius)
	{
		return Shape(SphereParams{ Radius });
	}

	Shape Box(double Width, double Height, double Depth)
	{
		return Shape(BoxParams{ Width, Height, Depth });
	}

	Shape Torus(double MajorRadius, double MinorRadius)
	{
		return Shape(TorusParams{ MajorRadius, MinorRadius });
	}

	Shape Cone(double Radius, double Height)
	{
		return Shape(ConeParams{ Radius, Height });
	}
}
