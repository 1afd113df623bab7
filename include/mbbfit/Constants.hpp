#pragma once

namespace mbbfit::constants {

/*  SI values (CODATA 2018 / IAU 2015, as used by astropy)                  */
constexpr double c_light   = 2.99792458e8;       // m s^-1
constexpr double h_planck  = 6.62607015e-34;     // J s
constexpr double k_boltz   = 1.380649e-23;       // J K^-1
constexpr double L_sun     = 3.828e26;           // W
constexpr double jansky    = 1.0e-26;            // W m^-2 Hz^-1
constexpr double megaparsec = 3.0856775814913673e22; // m
constexpr double micron    = 1.0e-6;             // m
constexpr double pi        = 3.14159265358979323846;

/*  c in micron Hz, for λ[µm] <-> ν[Hz]                                     */
constexpr double c_micron_hz = c_light / micron;

} // namespace mbbfit::constants
