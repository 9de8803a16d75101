// Copyright 2023 Aeva Palecek
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

#include <cmath>
#include <catch2/catch.hpp>
#include "sdfs.h"


using namespace glm;


TEST_CASE("Sphere", "[Shapes]")
{
	const Shape Sphere = SDF::Sphere(1.0);

	SECTION("Distance is correct")
	{
		CHECK(Sphere.LocalDistance(dvec3(0.0)) == Approx(-1.0));
		CHECK(Sphere.LocalDistance(dvec3(2.0, 0.0, 0.0)) == Approx(1.0));
		CHECK(Sphere.LocalDistance(dvec3(0.0, 0.0, -1.0)) == Approx(0.0).margin(1e-12));
	}

	SECTION("Bounds are tight")
	{
		const AABB Bounds = Sphere.LocalBounds();
		CHECK(Bounds.Min == dvec3(-1.0));
		CHECK(Bounds.Max == dvec3(1.0));
	}

	SECTION("Defaults")
	{
		const Shape Default;
		CHECK(Default.Kind() == ShapeKind::Sphere);
		CHECK(std::get<SphereParams>(Default.GetParams()).Radius == 1.0);
	}
}


TEST_CASE("Box", "[Shapes]")
{
	const Shape Box = SDF::Box(2.0, 2.0, 2.0);

	SECTION("Distance is correct")
	{
		CHECK(Box.LocalDistance(dvec3(0.0)) == Approx(-1.0));
		CHECK(Box.LocalDistance(dvec3(0.5, 0.0, 0.0)) == Approx(-0.5));
		CHECK(Box.LocalDistance(dvec3(2.0, 0.0, 0.0)) == Approx(1.0));
		CHECK(Box.LocalDistance(dvec3(2.0, 2.0, 0.0)) == Approx(std::sqrt(2.0)));
		CHECK(Box.LocalDistance(dvec3(1.0, 0.5, 0.5)) == Approx(0.0).margin(1e-12));
	}

	SECTION("Uneven extents")
	{
		const Shape Slab = SDF::Box(4.0, 1.0, 2.0);
		CHECK(Slab.LocalDistance(dvec3(0.0)) == Approx(-0.5));
		CHECK(Slab.LocalDistance(dvec3(0.0, 1.5, 0.0)) == Approx(1.0));
		CHECK(Slab.LocalBounds().Max == dvec3(2.0, 0.5, 1.0));
	}
}


TEST_CASE("Torus", "[Shapes]")
{
	const Shape Torus = SDF::Torus(0.7, 0.3);

	SECTION("Distance is correct")
	{
		CHECK(Torus.LocalDistance(dvec3(0.7, 0.0, 0.0)) == Approx(-0.3));
		CHECK(Torus.LocalDistance(dvec3(0.0, 0.0, -0.7)) == Approx(-0.3));
		CHECK(Torus.LocalDistance(dvec3(0.0)) == Approx(0.4));
		CHECK(Torus.LocalDistance(dvec3(1.0, 0.0, 0.0)) == Approx(0.0).margin(1e-12));
		CHECK(Torus.LocalDistance(dvec3(0.7, 0.3, 0.0)) == Approx(0.0).margin(1e-12));
	}

	SECTION("Bounds lie flat in XZ")
	{
		const AABB Bounds = Torus.LocalBounds();
		CHECK(Bounds.Max.x == Approx(1.0));
		CHECK(Bounds.Max.y == Approx(0.3));
		CHECK(Bounds.Max.z == Approx(1.0));
	}
}


TEST_CASE("Cone", "[Shapes]")
{
	const Shape Cone = SDF::Cone(1.0, 2.0);

	SECTION("Distance is correct")
	{
		// Apex and base center.
		CHECK(Cone.LocalDistance(dvec3(0.0, 1.0, 0.0)) == Approx(0.0).margin(1e-12));
		CHECK(Cone.LocalDistance(dvec3(0.0, -1.0, 0.0)) == Approx(0.0).margin(1e-12));

		// Nearest feature is the slanted side.
		CHECK(Cone.LocalDistance(dvec3(0.0)) == Approx(-1.0 / std::sqrt(5.0)));

		CHECK(Cone.LocalDistance(dvec3(0.0, -3.0, 0.0)) == Approx(2.0));
		CHECK(Cone.LocalDistance(dvec3(0.0, 3.0, 0.0)) == Approx(2.0));
	}

	SECTION("Bounds")
	{
		const AABB Bounds = Cone.LocalBounds();
		CHECK(Bounds.Min == dvec3(-1.0, -1.0, -1.0));
		CHECK(Bounds.Max == dvec3(1.0, 1.0, 1.0));
	}
}


TEST_CASE("Shape kinds", "[Shapes]")
{
	CHECK(ParseShapeKind("sphere") == ShapeKind::Sphere);
	CHECK(ParseShapeKind("box") == ShapeKind::Box);
	CHECK(ParseShapeKind("torus") == ShapeKind::Torus);
	CHECK(ParseShapeKind("cone") == ShapeKind::Cone);
	CHECK(ParseShapeKind("teapot") == ShapeKind::Invalid);

	CHECK(std::string(ShapeKindName(ShapeKind::Torus)) == "torus");
	CHECK(std::string(SDF::Cone(1.0, 1.0).Name()) == "cone");

	Shape Changing = SDF::Sphere(1.0);
	Changing.SetParams(BoxParams{ 1.0, 1.0, 1.0 });
	CHECK(Changing.Kind() == ShapeKind::Box);
}


TEST_CASE("Shape transforms", "[Shapes]")
{
	SECTION("Translated sphere")
	{
		Shape Sphere = SDF::Sphere(1.0);
		REQUIRE(Sphere.SetTranslation(dvec3(1.0, 2.0, 3.0)) == StatusCode::PASS);
		CHECK(Sphere.WorldDistance(dvec3(1.0, 2.0, 3.0)) == Approx(-1.0));
		CHECK(Sphere.WorldDistance(dvec3(2.0, 2.0, 3.0)) == Approx(0.0).margin(1e-12));

		const AABB Bounds = Sphere.WorldBounds();
		CHECK(Bounds.Min.x == Approx(0.0).margin(1e-12));
		CHECK(Bounds.Max.z == Approx(4.0));
	}

	SECTION("Scaled sphere keeps its surface at zero")
	{
		Shape Sphere = SDF::Sphere(1.0);
		REQUIRE(Sphere.SetScale(dvec3(2.0, 1.0, 1.0)) == StatusCode::PASS);
		CHECK(Sphere.WorldDistance(dvec3(2.0, 0.0, 0.0)) == Approx(0.0).margin(1e-12));
		CHECK(Sphere.WorldDistance(dvec3(0.0, 1.0, 0.0)) == Approx(0.0).margin(1e-12));
		CHECK(Sphere.WorldDistance(dvec3(1.5, 0.0, 0.0)) < 0.0);
		CHECK(Sphere.WorldBounds().Max.x == Approx(2.0));
	}

	SECTION("Rotated box")
	{
		Shape Box = SDF::Box(2.0, 1.0, 1.0);
		REQUIRE(Box.SetRotation(dvec3(0.0, 0.0, 90.0)) == StatusCode::PASS);
		const AABB Bounds = Box.WorldBounds();
		CHECK(Bounds.Max.x == Approx(0.5));
		CHECK(Bounds.Max.y == Approx(1.0));
		CHECK(Bounds.Max.z == Approx(0.5));
		CHECK(Box.WorldDistance(dvec3(0.0, 0.9, 0.0)) < 0.0);
		CHECK(Box.WorldDistance(dvec3(0.9, 0.0, 0.0)) > 0.0);
	}

	SECTION("Points round trip through the transform")
	{
		Shape Cone = SDF::Cone(1.0, 2.0);
		REQUIRE(Cone.SetTransform(dvec3(1.0, 2.0, 0.5), dvec3(30.0, 45.0, 60.0), dvec3(-1.0, 0.5, 2.0)) == StatusCode::PASS);
		const dvec3 Point = dvec3(0.25, -0.5, 0.75);
		const dvec3 RoundTrip = Cone.WorldToLocalPoint(Cone.LocalToWorldPoint(Point));
		CHECK(RoundTrip.x == Approx(Point.x));
		CHECK(RoundTrip.y == Approx(Point.y));
		CHECK(RoundTrip.z == Approx(Point.z));
	}

	SECTION("World bounds enclose the transformed surface")
	{
		Shape Torus = SDF::Torus(0.7, 0.3);
		REQUIRE(Torus.SetTransform(dvec3(1.5, 0.5, 1.0), dvec3(20.0, 0.0, 70.0), dvec3(0.3, -0.2, 0.1)) == StatusCode::PASS);
		const AABB Bounds = Torus.WorldBounds() + 1e-9;
		for (int Step = 0; Step < 64; ++Step)
		{
			const double Angle = double(Step) * (6.283185307179586 / 64.0);
			const dvec3 OnSurface = dvec3(std::cos(Angle), 0.0, std::sin(Angle));
			CHECK(Bounds.Contains(Torus.LocalToWorldPoint(OnSurface)));
		}
	}

	SECTION("Zero scale is rejected")
	{
		Shape Sphere = SDF::Sphere(1.0);
		REQUIRE(Sphere.SetScale(dvec3(2.0)) == StatusCode::PASS);

		CHECK(Sphere.SetScale(dvec3(1.0, 0.0, 1.0)) == StatusCode::INVALID_SHAPE_CONFIGURATION);
		CHECK(Sphere.SetTransform(dvec3(0.0), dvec3(0.0), dvec3(5.0)) == StatusCode::INVALID_SHAPE_CONFIGURATION);

		// The previous transform is still in effect.
		CHECK(Sphere.GetTransform().GetScale() == dvec3(2.0));
		CHECK(Sphere.GetTransform().GetTranslation() == dvec3(0.0));
		CHECK(Sphere.WorldDistance(dvec3(2.0, 0.0, 0.0)) == Approx(0.0).margin(1e-12));
	}

	SECTION("Negative scale mirrors")
	{
		Shape Cone = SDF::Cone(1.0, 2.0);
		REQUIRE(Cone.SetScale(dvec3(1.0, -1.0, 1.0)) == StatusCode::PASS);
		CHECK(Cone.WorldDistance(dvec3(0.0, -1.0, 0.0)) == Approx(0.0).margin(1e-12));
		CHECK(Cone.WorldDistance(dvec3(0.0, -3.0, 0.0)) == Approx(2.0));
	}
}


TEST_CASE("Transform", "[Shapes]")
{
	Transform Machine;
	CHECK(Machine.GetScale() == dvec3(1.0));
	CHECK(Machine.Apply(dvec3(1.0, 2.0, 3.0)) == dvec3(1.0, 2.0, 3.0));

	REQUIRE(Machine.Set(dvec3(2.0), dvec3(0.0, 0.0, 90.0), dvec3(10.0, 0.0, 0.0)) == StatusCode::PASS);

	// Scale, then rotate, then translate.
	const dvec3 Moved = Machine.Apply(dvec3(1.0, 0.0, 0.0));
	CHECK(Moved.x == Approx(10.0));
	CHECK(Moved.y == Approx(2.0));
	CHECK(Moved.z == Approx(0.0).margin(1e-12));

	const dvec3 Back = Machine.ApplyInv(Moved);
	CHECK(Back.x == Approx(1.0));
	CHECK(Back.y == Approx(0.0).margin(1e-12));

	Machine.Reset();
	CHECK(Machine.GetScale() == dvec3(1.0));
	CHECK(Machine.GetTranslation() == dvec3(0.0));
	CHECK(Machine.Apply(dvec3(1.0, 2.0, 3.0)) == dvec3(1.0, 2.0, 3.0));
}
