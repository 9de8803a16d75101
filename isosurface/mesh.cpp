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

#include "mesh.h"


void Mesh::Clear()
{
	Positions.clear();
	Triangles.clear();
	SmoothingGroups.clear();
}


void Mesh::SetSmoothShading(bool SmoothShading)
{
	const uint8_t Group = SmoothShading ? 1 : 0;
	for (uint8_t& Entry : SmoothingGroups)
	{
		Entry = Group;
	}
}


void Mesh::WalkTriangles(TriangleThunk Thunk) const
{
	for (const glm::uvec3& Triangle : Triangles)
	{
		Thunk({
			Positions[Triangle.x],
			Positions[Triangle.y],
			Positions[Triangle.z]});
	}
}


double Mesh::SignedVolume() const
{
	double Volume = 0.0;
	WalkTriangles([&](const TriangleT& Triangle)
	{
		const glm::dvec3 A = glm::dvec3(Triangle[0]);
		const glm::dvec3 B = glm::dvec3(Triangle[1]);
		const glm::dvec3 C = glm::dvec3(Triangle[2]);
		Volume += glm::dot(A, glm::cross(B, C)) / 6.0;
	});
	return Volume;
}
