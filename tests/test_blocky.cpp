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

#include <catch2/catch.hpp>
#include "mesh_checks.h"


using namespace glm;


TEST_CASE("Blocky box", "[Blocky]")
{
	VoxelGrid Grid;
	REQUIRE(Grid.SetVoxelSize(0.5f) == StatusCode::PASS);
	const Shape Box = SDF::Box(2.0, 2.0, 2.0);
	Grid.FitToShape(Box);
	Grid.Voxelize(Box);
	REQUIRE(Grid.GetDimensions() == ivec3(6, 6, 6));

	Mesh Surface;
	Meshing::Blocky(Grid, 0.0f, true, Surface);

	SECTION("One quad per exposed voxel face")
	{
		// The inside voxels form a 4x4x4 block, so each side exposes 16 faces.
		CHECK(Surface.TriangleCount() == 192);
		CHECK(Surface.SmoothingGroups.size() == 192);
	}

	SECTION("Corners are shared")
	{
		// Surface lattice points of a 5x5x5 grid of corners.
		CHECK(Surface.VertexCount() == 5 * 5 * 5 - 3 * 3 * 3);
		CHECK(Surface.VertexCount() < 4 * (Surface.TriangleCount() / 2));
		CHECK_FALSE(HasDuplicateVertices(Surface));
	}

	SECTION("Faces point outward")
	{
		CHECK(CountInwardTriangles(Surface, vec3(0.0f)) == 0);
		CHECK(WindingIsConsistent(Surface));
		CHECK(Surface.SignedVolume() == Approx(8.0));
	}

	SECTION("Vertices lie on the voxel lattice")
	{
		for (const vec3& Position : Surface.Positions)
		{
			CHECK(all(lessThanEqual(abs(Position), vec3(1.0f))));
		}
	}
}


TEST_CASE("Blocky sphere", "[Blocky]")
{
	const Shape Sphere = SDF::Sphere(1.0);
	const Mesh Surface = BuildSurface(Sphere, 0.1f, MesherKind::Blocky);

	REQUIRE(Surface.TriangleCount() > 0);
	CHECK(Surface.TriangleCount() % 2 == 0);
	CHECK(Surface.VertexCount() < 4 * (Surface.TriangleCount() / 2));
	CHECK_FALSE(HasDuplicateVertices(Surface));
	CHECK(WindingIsConsistent(Surface));
	CHECK(CountInwardTriangles(Surface, vec3(0.0f)) == 0);

	for (const vec3& Position : Surface.Positions)
	{
		CHECK(length(Position) == Approx(1.0).margin(0.1));
	}
}


TEST_CASE("Blocky iso level", "[Blocky]")
{
	const Shape Sphere = SDF::Sphere(1.0);
	const Mesh Shrunk = BuildSurface(Sphere, 0.1f, MesherKind::Blocky, -0.5f);
	const Mesh Grown = BuildSurface(Sphere, 0.1f, MesherKind::Blocky, 0.2f);

	CHECK(Shrunk.SignedVolume() == Approx(4.18879 * 0.125).epsilon(0.15));
	CHECK(Grown.SignedVolume() > Shrunk.SignedVolume());
	for (const vec3& Position : Shrunk.Positions)
	{
		CHECK(length(Position) < 0.65f);
	}
}


TEST_CASE("Blocky empty grid", "[Blocky]")
{
	const Shape Sphere = SDF::Sphere(1.0);
	const Mesh Surface = BuildSurface(Sphere, 0.1f, MesherKind::Blocky, -2.0f);
	CHECK(Surface.TriangleCount() == 0);
	CHECK(Surface.VertexCount() == 0);
}
