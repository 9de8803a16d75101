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

#include <array>
#include <string>
#include <catch2/catch.hpp>
#include "mesh_checks.h"


using namespace glm;


static const std::array<MesherKind, 3> AllMeshers = {
	MesherKind::Blocky,
	MesherKind::MarchingCubes,
	MesherKind::SurfaceNets
};


TEST_CASE("Mesher kinds", "[Meshers]")
{
	CHECK(ParseMesherKind("blocky") == MesherKind::Blocky);
	CHECK(ParseMesherKind("marching-cubes") == MesherKind::MarchingCubes);
	CHECK(ParseMesherKind("surface-nets") == MesherKind::SurfaceNets);
	CHECK(ParseMesherKind("dual-contouring") == MesherKind::Invalid);

	for (const MesherKind Kind : AllMeshers)
	{
		CHECK(ParseMesherKind(MesherKindName(Kind)) == Kind);
	}
}


TEST_CASE("Meshers are deterministic", "[Meshers]")
{
	Shape Torus = SDF::Torus(0.7, 0.3);
	REQUIRE(Torus.SetTransform(dvec3(1.0, 1.5, 1.0), dvec3(30.0, 0.0, 15.0), dvec3(0.1, 0.2, 0.3)) == StatusCode::PASS);

	for (const MesherKind Kind : AllMeshers)
	{
		const Mesh First = BuildSurface(Torus, 0.1f, Kind);
		const Mesh Second = BuildSurface(Torus, 0.1f, Kind);
		CHECK(First.TriangleCount() > 0);
		CHECK(SameMesh(First, Second));
	}
}


TEST_CASE("Meshers replace previous contents", "[Meshers]")
{
	const Shape Sphere = SDF::Sphere(1.0);
	VoxelGrid Grid;
	Grid.FitToShape(Sphere);
	Grid.Voxelize(Sphere);

	for (const MesherKind Kind : AllMeshers)
	{
		Mesh Fresh;
		REQUIRE(BuildMesh(Kind, Grid, 0.0f, true, Fresh) == StatusCode::PASS);

		Mesh Reused;
		REQUIRE(BuildMesh(Kind, Grid, -0.5f, false, Reused) == StatusCode::PASS);
		REQUIRE(BuildMesh(Kind, Grid, 0.0f, true, Reused) == StatusCode::PASS);

		CHECK(SameMesh(Fresh, Reused));
	}
}


TEST_CASE("Unknown meshers are rejected", "[Meshers]")
{
	const Shape Sphere = SDF::Sphere(1.0);
	VoxelGrid Grid;
	Grid.FitToShape(Sphere);
	Grid.Voxelize(Sphere);

	Mesh Surface;
	REQUIRE(BuildMesh(MesherKind::Blocky, Grid, 0.0f, true, Surface) == StatusCode::PASS);
	const size_t Triangles = Surface.TriangleCount();
	REQUIRE(Triangles > 0);

	CHECK(BuildMesh(MesherKind::Invalid, Grid, 0.0f, true, Surface) == StatusCode::FAIL);
	CHECK(BuildMesh(MesherKind(-1), Grid, 0.0f, true, Surface) == StatusCode::FAIL);
	CHECK(Surface.TriangleCount() == Triangles);
	CHECK(std::string(MesherKindName(MesherKind::Invalid)) == "invalid");
}


TEST_CASE("Meshers tag every triangle with the smoothing flag", "[Meshers]")
{
	const Shape Cone = SDF::Cone(1.0, 2.0);
	for (const MesherKind Kind : AllMeshers)
	{
		for (const bool Smooth : { true, false })
		{
			const Mesh Surface = BuildSurface(Cone, 0.1f, Kind, 0.0f, Smooth);
			REQUIRE(Surface.SmoothingGroups.size() == Surface.TriangleCount());
			for (const uint8_t Group : Surface.SmoothingGroups)
			{
				CHECK(Group == (Smooth ? 1 : 0));
			}
		}
	}
}


TEST_CASE("Meshers produce closed outward surfaces", "[Meshers]")
{
	Shape Box = SDF::Box(1.0, 0.6, 1.4);
	REQUIRE(Box.SetTransform(dvec3(1.0), dvec3(10.0, 20.0, 30.0), dvec3(-0.5, 0.25, 0.0)) == StatusCode::PASS);

	const std::array<Shape, 4> Shapes = {
		SDF::Sphere(0.8),
		Box,
		SDF::Torus(0.7, 0.3),
		SDF::Cone(1.0, 2.0)
	};

	for (const Shape& Target : Shapes)
	{
		for (const MesherKind Kind : AllMeshers)
		{
			INFO(Target.Name() << " " << MesherKindName(Kind));
			const Mesh Surface = BuildSurface(Target, 0.1f, Kind);
			REQUIRE(Surface.TriangleCount() > 0);
			CHECK_FALSE(HasDuplicateVertices(Surface));
			CHECK(WindingIsConsistent(Surface));
			CHECK(Surface.SignedVolume() > 0.0);
		}
	}
}


TEST_CASE("Sphere normals face away from the center", "[Meshers]")
{
	const Shape Sphere = SDF::Sphere(1.0);
	for (const MesherKind Kind : AllMeshers)
	{
		INFO(MesherKindName(Kind));
		const Mesh Surface = BuildSurface(Sphere, 0.1f, Kind);
		CHECK(CountInwardTriangles(Surface, vec3(0.0f)) == 0);
	}
}
