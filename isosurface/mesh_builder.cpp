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
#include <bit>
#include "mesh_builder.h"
#include "profiling.h"


using namespace glm;


struct MesherDispatch
{
	const char* Name;
	void (*Build)(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh);
};


static const std::array<MesherDispatch, size_t(MesherKind::Count)> MesherTable =
{{
	{ "blocky", Meshing::Blocky },
	{ "marching-cubes", Meshing::MarchingCubes },
	{ "surface-nets", Meshing::SurfaceNets }
}};


const char* MesherKindName(MesherKind Kind)
{
	if (Kind >= MesherKind::Blocky && Kind < MesherKind::Count)
	{
		return MesherTable[size_t(Kind)].Name;
	}
	return "invalid";
}


MesherKind ParseMesherKind(const std::string& Name)
{
	for (size_t Index = 0; Index < MesherTable.size(); ++Index)
	{
		if (Name == MesherTable[Index].Name)
		{
			return MesherKind(Index);
		}
	}
	return MesherKind::Invalid;
}


StatusCode BuildMesh(MesherKind Kind, const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh)
{
	if (Kind < MesherKind::Blocky || Kind >= MesherKind::Count)
	{
		return StatusCode::FAIL;
	}
	const MesherDispatch& Mesher = MesherTable[size_t(Kind)];
	ProfileScope Scope(Mesher.Name);
	Mesher.Build(Grid, IsoLevel, SmoothShading, OutMesh);
	return StatusCode::PASS;
}


bool MeshWriter::LessVec3::operator()(const vec3& L, const vec3& R) const
{
	// Compare bit patterns so that only bit-identical positions merge.
	const uvec3 LBits = uvec3(std::bit_cast<uint32_t>(L.x), std::bit_cast<uint32_t>(L.y), std::bit_cast<uint32_t>(L.z));
	const uvec3 RBits = uvec3(std::bit_cast<uint32_t>(R.x), std::bit_cast<uint32_t>(R.y), std::bit_cast<uint32_t>(R.z));
	if (LBits.z < RBits.z)
	{
		return true;
	}
	else if (LBits.z == RBits.z)
	{
		if (LBits.y < RBits.y)
		{
			return true;
		}
		else if (LBits.y == RBits.y)
		{
			return LBits.x < RBits.x;
		}
	}

	return false;
}


MeshWriter::MeshWriter(Mesh& InTarget, bool SmoothShading)
	: Target(InTarget)
	, SmoothGroup(SmoothShading ? 1 : 0)
{
	Target.Clear();
}


uint32_t MeshWriter::Vertex(vec3 Position)
{
	auto [Found, Inserted] = Memo.insert({ Position, uint32_t(Target.Positions.size()) });
	if (Inserted)
	{
		Target.Positions.push_back(Position);
	}
	return Found->second;
}


void MeshWriter::Triangle(vec3 P0, vec3 P1, vec3 P2)
{
	const uint32_t I0 = Vertex(P0);
	const uint32_t I1 = Vertex(P1);
	const uint32_t I2 = Vertex(P2);
	Target.Triangles.push_back(uvec3(I0, I1, I2));
	Target.SmoothingGroups.push_back(SmoothGroup);
}


void MeshWriter::Quad(vec3 P0, vec3 P1, vec3 P2, vec3 P3)
{
	const uint32_t I0 = Vertex(P0);
	const uint32_t I1 = Vertex(P1);
	const uint32_t I2 = Vertex(P2);
	const uint32_t I3 = Vertex(P3);
	Target.Triangles.push_back(uvec3(I0, I1, I2));
	Target.Triangles.push_back(uvec3(I0, I2, I3));
	Target.SmoothingGroups.push_back(SmoothGroup);
	Target.SmoothingGroups.push_back(SmoothGroup);
}


vec3 EdgeIntersection(float IsoLevel, vec3 Start, vec3 End, float StartDist, float EndDist)
{
	const float Alpha = (IsoLevel - StartDist) / (EndDist - StartDist);
	return Start * (1.0f - Alpha) + End * Alpha;
}
