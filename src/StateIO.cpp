#include "mbbfit/StateIO.hpp"
#include "mbbfit/Errors.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace mbbfit {

namespace {

constexpr const char* kStateHeader = "# L    T    beta    z    opthin    pl";
constexpr const char* kBlobFormat  = "mbbfit-state";
constexpr int         kBlobVersion = 1;

double round4(double x)
{
    return std::round(x * 1e4) / 1e4;
}

const char* py_bool(bool b)
{
    return b ? "True" : "False";
}

bool parse_bool(const std::string& s, const std::string& path)
{
    if (s == "True")  return true;
    if (s == "False") return false;
    throw StateFormatError(path + ": expected True or False, got '" + s + "'");
}

double parse_double(const std::string& s, const std::string& path)
{
    try {
        std::size_t used = 0;
        const double v = std::stod(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw StateFormatError(path + ": '" + s + "' is not a number");
    }
}

/* ---- Eigen <-> JSON ---------------------------------------------------- */
nlohmann::json encode(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

nlohmann::json encode(const Matrix& m)
{
    // row-major flattening
    std::vector<double> flat;
    flat.reserve(static_cast<std::size_t>(m.size()));
    for (Eigen::Index r = 0; r < m.rows(); ++r)
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            flat.push_back(m(r, c));
    return {{"rows", m.rows()}, {"cols", m.cols()}, {"data", flat}};
}

Vector vector_from(const nlohmann::json& j)
{
    const auto v = j.get<std::vector<double>>();
    return Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

Matrix matrix_from(const nlohmann::json& j)
{
    const auto rows = j.at("rows").get<Eigen::Index>();
    const auto cols = j.at("cols").get<Eigen::Index>();
    const auto flat = j.at("data").get<std::vector<double>>();
    if (rows < 0 || cols < 0 || static_cast<Eigen::Index>(flat.size()) != rows * cols)
        throw StateFormatError("matrix size does not match its data");

    Matrix m(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r)
        for (Eigen::Index c = 0; c < cols; ++c)
            m(r, c) = flat[static_cast<std::size_t>(r * cols + c)];
    return m;
}

} // namespace

/* ------------------------------------------------------------------------ */
/*  scalar text record                                                      */
/* ------------------------------------------------------------------------ */
void save_state(const ModifiedBlackbody& mbb, const std::string& path)
{
    std::ofstream f(path, std::ios::trunc);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");

    f << kStateHeader << '\n';
    f << std::setprecision(15)
      << round4(mbb.log_luminosity()) << '\t'
      << round4(mbb.temperature())    << '\t'
      << round4(mbb.beta())           << '\t'
      << round4(mbb.redshift())       << '\t'
      << py_bool(mbb.optically_thin()) << '\t'
      << py_bool(mbb.power_law())      << '\t' << '\n';
}

ModifiedBlackbody load_state(const std::string& path, const ModelOptions& opt)
{
    std::ifstream f(path);
    if (!f)
        throw StateFormatError("Cannot open '" + path + "'");

    std::string header, record;
    if (!std::getline(f, header) || !std::getline(f, record))
        throw StateFormatError(path + ": expected a header line and a record line");

    std::vector<std::string> bits;
    std::istringstream ss(record);
    std::string field;
    while (std::getline(ss, field, '\t'))
        bits.push_back(field);
    if (bits.size() < 6)
        throw StateFormatError(path + ": record has " + std::to_string(bits.size())
                               + " fields, expected 6");

    const double L     = parse_double(bits[0], path);
    const double T     = parse_double(bits[1], path);
    const double beta  = parse_double(bits[2], path);
    const double z     = parse_double(bits[3], path);
    const bool   thin  = parse_bool(bits[4], path);
    const bool   pl    = parse_bool(bits[5], path);

    return ModifiedBlackbody(L, T, beta, z, make_variant(thin, pl), opt);
}

/* ------------------------------------------------------------------------ */
/*  full CBOR blob                                                          */
/* ------------------------------------------------------------------------ */
void save_full_state(const ModifiedBlackbody& mbb, const std::string& path)
{
    const ModelOptions& o = mbb.options();

    nlohmann::json j;
    j["format"]  = kBlobFormat;
    j["version"] = kBlobVersion;
    j["model"] = {
        {"logL",     mbb.log_luminosity()},
        {"logN",     mbb.log_norm()},
        {"T",        mbb.temperature()},
        {"beta",     mbb.beta()},
        {"z",        mbb.redshift()},
        {"variant",  to_string(mbb.variant())},
        {"H0",       o.cosmology.H0},
        {"Om0",      o.cosmology.Om0},
        {"band",     {o.integration.band.lo, o.integration.band.hi}},
        {"gridPoints", o.integration.grid_points},
        {"calibration", {{"initialLogNorm", o.calibration.initial_log_norm},
                         {"tolerance",      o.calibration.tolerance},
                         {"maxIterations",  o.calibration.max_iterations}}}
    };

    if (mbb.has_fit()) {
        const FitResult& r = mbb.fit_result();
        j["fit"] = {
            {"nWalkers",       r.n_walkers},
            {"nSteps",         r.n_steps},
            {"dim",            r.dim()},
            {"fixedBeta",      r.fixed_beta},
            {"chain",          encode(r.chain)},
            {"logProb",        encode(r.log_prob)},
            {"finalPositions", encode(r.final_positions)},
            {"finalLogProb",   encode(r.final_log_prob)},
            {"acceptance",     encode(r.acceptance)}
        };
    }

    const std::vector<std::uint8_t> blob = nlohmann::json::to_cbor(j);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    f.write(reinterpret_cast<const char*>(blob.data()),
            static_cast<std::streamsize>(blob.size()));
}

ModifiedBlackbody restore_full_state(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw StateFormatError("Cannot open '" + path + "'");
    const std::vector<std::uint8_t> blob((std::istreambuf_iterator<char>(f)),
                                          std::istreambuf_iterator<char>());

    try {
        const nlohmann::json j = nlohmann::json::from_cbor(blob);
        if (j.value("format", std::string{}) != kBlobFormat)
            throw StateFormatError(path + ": not an mbbfit state blob");
        if (j.value("version", 0) != kBlobVersion)
            throw StateFormatError(path + ": unsupported state version "
                                   + std::to_string(j.value("version", 0)));

        const auto& m = j.at("model");
        ModelOptions opt;
        opt.cosmology.H0  = m.at("H0").get<double>();
        opt.cosmology.Om0 = m.at("Om0").get<double>();
        const auto band   = m.at("band").get<std::array<double, 2>>();
        opt.integration.band        = {band[0], band[1]};
        opt.integration.grid_points = m.at("gridPoints").get<int>();
        const auto& c = m.at("calibration");
        opt.calibration.initial_log_norm = c.at("initialLogNorm").get<double>();
        opt.calibration.tolerance        = c.at("tolerance").get<double>();
        opt.calibration.max_iterations   = c.at("maxIterations").get<int>();

        ModifiedBlackbody mbb = ModifiedBlackbody::from_normalization(
            m.at("logN").get<double>(), m.at("T").get<double>(), m.at("beta").get<double>(),
            m.at("z").get<double>(), variant_from_string(m.at("variant").get<std::string>()),
            opt);

        if (j.contains("fit")) {
            const auto& fj = j["fit"];
            FitResult r;
            r.n_walkers       = fj.at("nWalkers").get<int>();
            r.n_steps         = fj.at("nSteps").get<int>();
            r.fixed_beta      = fj.value("fixedBeta", mbb.beta());
            r.chain           = matrix_from(fj.at("chain"));
            r.log_prob        = vector_from(fj.at("logProb"));
            r.final_positions = matrix_from(fj.at("finalPositions"));
            r.final_log_prob  = vector_from(fj.at("finalLogProb"));
            r.acceptance      = vector_from(fj.at("acceptance"));
            if (r.chain.rows() != static_cast<Eigen::Index>(r.n_walkers) * r.n_steps
                || r.log_prob.size() != r.chain.rows()
                || r.dim() != fj.value("dim", r.dim()))
                throw StateFormatError(path + ": chain shape does not match walkers x steps");
            mbb.attach_fit(std::move(r));
        }
        return mbb;
    } catch (const nlohmann::json::exception& e) {
        throw StateFormatError(path + ": " + e.what());
    }
}

} // namespace mbbfit
