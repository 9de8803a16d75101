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

#pragma once

#include "glm_common.h"
#include "aabb.h"
#include "errors.h"


// Affine transform applied to a shape, composed as Translate * RotateZ * RotateY * RotateX * Scale.
// Both directions are cached and rebuilt eagerly on every change, so a query can never observe
// a stale matrix.  A change that would make the transform non-invertible is rejected and leaves
// the previous state untouched.
class Transform
{
public:
	Transform();

	void Reset();

	StatusCode Set(glm::dvec3 NewScale, glm::dvec3 NewRotationDegrees, glm::dvec3 NewTranslation);
	StatusCode SetScale(glm::dvec3 NewScale);
	StatusCode SetRotation(glm::dvec3 NewRotationDegrees);
	StatusCode SetTranslation(glm::dvec3 NewTranslation);

	glm::dvec3 GetScale() const { return Scalation; }
	glm::dvec3 GetRotation() const { return RotationDegrees; }
	glm::dvec3 GetTranslation() const { return Translation; }

	// Local to world.
	glm::dvec3 Apply(glm::dvec3 Point) const;

	// World to local.
	glm::dvec3 ApplyInv(glm::dvec3 Point) const;

	// Transforms all eight corners and returns the box enclosing them.
	AABB Apply(const AABB& Bounds) const;

private:
	StatusCode Rebuild(glm::dvec3 NewScale, glm::dvec3 NewRotationDegrees, glm::dvec3 NewTranslation);

	glm::dvec3 Scalation;
	glm::dvec3 RotationDegrees;
	glm::dvec3 Translation;

	glm::dmat4 LocalToWorld;
	glm::dmat4 WorldToLocal;
};
