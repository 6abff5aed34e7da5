#include "specclean/Config.hpp"
#include "specclean/ContinuumNormalizer.hpp"
#include "specclean/ContinuumReference.hpp"
#include "specclean/ErrorInflation.hpp"
#include "specclean/ReportUtils.hpp"
#include "specclean/Spectrum.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace specclean;

// Explicit --config wins, otherwise look for specclean.json in the usual places
static std::optional<std::string> find_config(const cxxopts::ParseResult& cli)
{
    if (cli.count("config")) return cli["config"].as<std::string>();

    std::vector<std::string> search_paths = {
        // 1. Current working directory
        "specclean.json",

        // 2. Same directory as executable
        []() {
            std::error_code ec;
            auto exe_path = fs::canonical("/proc/self/exe", ec);
            if (ec) return std::string("./specclean.json");
            return (exe_path.parent_path() / "specclean.json").string();
        }(),

        // 3. Source directory (development build)
        "../specclean.json"
    };

    for (const auto& path : search_paths)
        if (fs::exists(path)) return path;
    return std::nullopt;
}

static Interval interval_from_cli(const std::vector<double>& v, const char* name)
{
    if (v.size() != 2)
        throw std::runtime_error(std::string("--") + name + " needs two values: lo,hi");
    return Interval(v[0], v[1]);
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("specclean", "Continuum normalisation of APOGEE-style spectra");
        opts.add_options()
            ("s,spectrum", "Star spectrum (ASCII: lambda flux sigma bitmask)", cxxopts::value<std::string>())
            ("r,reference", "Continuum reference table (ascii/json/fits)", cxxopts::value<std::string>())
            ("reference-format", "Reference format: auto, ascii, json, fits", cxxopts::value<std::string>())
            ("c,config", "Run configuration JSON", cxxopts::value<std::string>())
            ("o,out", "Output CSV", cxxopts::value<std::string>()->default_value("normalized.csv"))
            ("interval", "Fit interval lo,hi in A", cxxopts::value<std::vector<double>>())
            ("final-interval", "Output interval lo,hi in A", cxxopts::value<std::vector<double>>())
            ("degree", "Polynomial degree", cxxopts::value<int>())
            ("bad-mask", "Combined APOGEE_PIXMASK of bad bits (e.g. 4351)", cxxopts::value<unsigned>())
            ("wl-start", "log10 start wavelength (3-column spectra)", cxxopts::value<double>())
            ("wl-delta", "log10 wavelength step (3-column spectra)", cxxopts::value<double>())
            ("v,verbose", "Print fit details")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("spectrum")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        /* ---------- configuration: file, then command line ----------- */
        RunConfig rc;
        if (auto cfg_path = find_config(cli)) {
            rc = load_run_config(*cfg_path);
            std::cout << "Loaded config from: " << *cfg_path << '\n';
        }
        auto& nc = rc.normalizer;

        if (cli.count("reference"))        rc.reference_path   = cli["reference"].as<std::string>();
        if (cli.count("reference-format")) rc.reference_format = cli["reference-format"].as<std::string>();
        if (cli.count("interval"))
            nc.interval = interval_from_cli(cli["interval"].as<std::vector<double>>(), "interval");
        if (cli.count("final-interval"))
            nc.final_interval = interval_from_cli(cli["final-interval"].as<std::vector<double>>(),
                                                  "final-interval");
        if (cli.count("degree"))   nc.degree     = cli["degree"].as<int>();
        if (cli.count("bad-mask")) nc.bad_pixels = BadPixelSpec::from_mask(cli["bad-mask"].as<unsigned>());
        if (cli.count("verbose"))  nc.verbose    = true;

        if (nc.bad_pixels.empty())
            std::cout << "Warning: no significant bitmask bits, no pixel will be flagged\n";

        if (rc.reference_path.empty())
            throw std::runtime_error("no continuum reference given (--reference or referencePath)");

        /* ---------- inputs ------------------------------------------- */
        const ContinuumReference reference = load_reference(rc.reference_path, rc.reference_format);
        std::cout << "Loaded: " << fs::path(rc.reference_path).filename().string() << " ("
                  << reference.size() << " rows, "
                  << reference.continuum_wavelengths().size() << " continuum)\n";

        const std::string spath = cli["spectrum"].as<std::string>();
        StarSpectrum star;
        if (cli.count("wl-start") || cli.count("wl-delta")) {
            if (!cli.count("wl-start") || !cli.count("wl-delta"))
                throw std::runtime_error("--wl-start and --wl-delta go together");
            star = load_star_ascii(spath, cli["wl-start"].as<double>(), cli["wl-delta"].as<double>());
        } else {
            star = load_star_ascii(spath);
        }
        std::cout << "Loaded: " << fs::path(spath).filename().string() << " (" << star.size()
                  << " points, " << count_bad_pixels(star.bitmask, nc.bad_pixels)
                  << " flagged)\n";

        /* ---------- normalise ---------------------------------------- */
        ContinuumNormalizer normalizer(reference, nc);
        const NormalizedSpectrum ns = normalizer.normalize(star);

        const std::string out = cli["out"].as<std::string>();
        write_normalized_csv(out, ns);
        std::cout << summary_line(fs::path(spath).filename().string(), ns) << '\n'
                  << "Wrote " << out << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "Took: " << ms << " ms\n";

    return 0;
}
