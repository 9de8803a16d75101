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

#include "transform.h"

using namespace glm;


static const dvec3 AxisX = dvec3(1.0, 0.0, 0.0);
static const dvec3 AxisY = dvec3(0.0, 1.0, 0.0);
static const dvec3 AxisZ = dvec3(0.0, 0.0, 1.0);


Transform::Transform()
{
	Reset();
}


void Transform::Reset()
{
	Scalation = dvec3(1.0);
	RotationDegrees = dvec3(0.0);
	Translation = dvec3(0.0);
	LocalToWorld = identity<dmat4>();
	WorldToLocal = identity<dmat4>();
}


StatusCode Transform::Set(dvec3 NewScale, dvec3 NewRotationDegrees, dvec3 NewTranslation)
{
	return Rebuild(NewScale, NewRotationDegrees, NewTranslation);
}


StatusCode Transform::SetScale(dvec3 NewScale)
{
	return Rebuild(NewScale, RotationDegrees, Translation);
}


StatusCode Transform::SetRotation(dvec3 NewRotationDegrees)
{
	return Rebuild(Scalation, NewRotationDegrees, Translation);
}


StatusCode Transform::SetTranslation(dvec3 NewTranslation)
{
	return Rebuild(Scalation, RotationDegrees, NewTranslation);
}


StatusCode Transform::Rebuild(dvec3 NewScale, dvec3 NewRotationDegrees, dvec3 NewTranslation)
{
	if (any(equal(NewScale, dvec3(0.0))))
	{
		return StatusCode::INVALID_SHAPE_CONFIGURATION;
	}

	const dvec3 Radians = radians(NewRotationDegrees);
	const dmat4 Identity = identity<dmat4>();

	const dmat4 ScaleMatrix = scale(Identity, NewScale);
	const dmat4 RotateXMatrix = rotate(Identity, Radians.x, AxisX);
	const dmat4 RotateYMatrix = rotate(Identity, Radians.y, AxisY);
	const dmat4 RotateZMatrix = rotate(Identity, Radians.z, AxisZ);
	const dmat4 TranslateMatrix = translate(Identity, NewTranslation);

	const dmat4 InvScaleMatrix = scale(Identity, dvec3(1.0) / NewScale);
	const dmat4 InvRotateXMatrix = rotate(Identity, -Radians.x, AxisX);
	const dmat4 InvRotateYMatrix = rotate(Identity, -Radians.y, AxisY);
	const dmat4 InvRotateZMatrix = rotate(Identity, -Radians.z, AxisZ);
	const dmat4 InvTranslateMatrix = translate(Identity, -NewTranslation);

	LocalToWorld = TranslateMatrix * RotateZMatrix * RotateYMatrix * RotateXMatrix * ScaleMatrix;
	WorldToLocal = InvScaleMatrix * InvRotateXMatrix * InvRotateYMatrix * InvRotateZMatrix * InvTranslateMatrix;

	Scalation = NewScale;
	RotationDegrees = NewRotationDegrees;
	Translation = NewTranslation;
	return StatusCode::PASS;
}


dvec3 Transform::Apply(dvec3 Point) const
{
	return dvec3(LocalToWorld * dvec4(Point, 1.0));
}


dvec3 Transform::ApplyInv(dvec3 Point) const
{
	return dvec3(WorldToLocal * dvec4(Point, 1.0));
}


AABB Transform::Apply(const AABB& Bounds) const
{
	AABB WorldBounds = AABB::Empty();
	for (const dvec3& Corner : Bounds.Corners())
	{
		WorldBounds.Extend(Apply(Corner));
	}
	return WorldBounds;
}
