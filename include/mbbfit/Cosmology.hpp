#pragma once

namespace mbbfit {

struct CosmologyParams {
    double H0  = 70.0;   // km s^-1 Mpc^-1
    double Om0 = 0.30;   // matter density today, flat => Ode0 = 1 - Om0
};

/*  Flat ΛCDM background without radiation (astropy FlatLambdaCDM with
 *  Tcmb0 = 0).  Distances are returned in metres.                          */
class Cosmology {
public:
    explicit Cosmology(const CosmologyParams& p = {});

    double efunc(double z) const;                   // H(z)/H0
    double comoving_distance(double z) const;       // m
    double luminosity_distance(double z) const;     // m

    const CosmologyParams& params() const { return p_; }

private:
    CosmologyParams p_;
    double hubble_distance_;                        // c/H0 in m
};

} // namespace mbbfit
