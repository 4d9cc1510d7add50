// Physical dimensions of an aperture descriptor. Fields that a shape needs
// but the descriptor leaves unset are filled in with the shape's default, so
// the rasterizer, the grid sizing and the optics report all agree on the
// same geometry. All lengths are in millimeters.
// Author: Philip Salvaggio

#ifndef APERTURE_GEOMETRY_H
#define APERTURE_GEOMETRY_H

#include "base/aperture_parameters.pb.h"

namespace apsim {

// Overall size: disc diameter, slit length, dot diameter, or critical
// dimension depending on the shape. Zero if required but missing.
double ApertureDiameter(const ApertureParameters& params);

double ApertureInnerDiameter(const ApertureParameters& params);

// Width of slits and drawn strokes.
double ApertureSlitWidth(const ApertureParameters& params);

// Peak to peak height of the waves, or the petal amplitude of a rosette.
double ApertureAmplitude(const ApertureParameters& params);

// Element spacing. For dot patterns this is the pattern radius, for slit
// arrays the center to center spacing, for lithography the assist gap, and
// for the fractals the overall side length.
double ApertureSpread(const ApertureParameters& params);

int ApertureCount(const ApertureParameters& params);
int ApertureZones(const ApertureParameters& params);
int ApertureUraRank(const ApertureParameters& params);

// Requested recursion depth, capped per shape.
int ApertureIterations(const ApertureParameters& params);

double ApertureBrushSize(const ApertureParameters& params);

// Whether the shape is drawn as a line of constant width.
bool IsStrokeShape(ApertureParameters::ApertureType type);

// Size of the smallest diffracting feature, which sets the angular spread of
// the diffraction pattern.
double FeatureSize(const ApertureParameters& params);

// Largest extent of the drawn shape in any direction.
double GeometricExtent(const ApertureParameters& params);

}

#endif  // APERTURE_GEOMETRY_H
