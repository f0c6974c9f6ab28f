#include "GnuplotEngine.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnGnuplot(const std::string& executable,
                 const std::string& scriptPath,
                 const std::string& stderrPath) {
    const int errFd = ::open(stderrPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (errFd < 0) return -1;

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        ::close(errFd);
        return -1;
    }

    if (::posix_spawn_file_actions_adddup2(&actions, errFd, STDERR_FILENO) != 0 ||
        ::posix_spawn_file_actions_addclose(&actions, errFd) != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        ::close(errFd);
        return -1;
    }

    posix_spawnattr_t attr;
    if (::posix_spawnattr_init(&attr) != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        ::close(errFd);
        return -1;
    }

    const char* argvRaw[] = {executable.c_str(), scriptPath.c_str(), nullptr};
    char* const* argv = const_cast<char* const*>(argvRaw);
    pid_t pid = -1;
    const int spawnRc = ::posix_spawn(&pid, executable.c_str(), &actions, &attr, argv, environ);

    ::posix_spawnattr_destroy(&attr);
    ::posix_spawn_file_actions_destroy(&actions);
    ::close(errFd);

    if (spawnRc != 0 || pid <= 0) return -1;

    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

unsigned long rgbValue(const std::string& hex) {
    if (hex.size() != 7 || hex[0] != '#') return 0;
    return std::strtoul(hex.c_str() + 1, nullptr, 16);
}
} // namespace

std::string GnuplotEngine::sanitizeId(const std::string& id) {
    std::string out = id;
    std::replace_if(out.begin(), out.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-');
    }, '_');
    if (out.empty()) out = "plot";
    return out;
}

std::string GnuplotEngine::quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotEngine::terminalForFormat(const std::string& format, int width, int height) {
    if (format == "svg") return "svg size " + std::to_string(width) + "," + std::to_string(height);
    if (format == "pdf") return "pdfcairo size 11in,8in";
    return "pngcairo size " + std::to_string(width) + "," + std::to_string(height);
}

std::string GnuplotEngine::styledHeader(const std::string& id, const std::string& title) const {
    const std::string safeId = sanitizeId(id);
    const bool darkTheme = (cfg_.theme == "dark");
    const std::string titleColor = darkTheme ? "#f9fafb" : "#1f2937";
    const std::string borderColor = darkTheme ? "#6b7280" : "#9ca3af";
    const std::string ticColor = darkTheme ? "#e5e7eb" : "#374151";
    const std::string gridColor = darkTheme ? "#374151" : "#e5e7eb";
    const std::string bgColor = darkTheme ? "#111827" : "#ffffff";

    std::ostringstream script;
    script << "set terminal " << terminalForFormat(cfg_.format, cfg_.width, cfg_.height) << " enhanced\n";
    script << "set output " << quoteForGnuplot(assetsDir_ + "/" + safeId + "." + cfg_.format) << "\n";
    script << "set object 999 rect from graph 0,0 to graph 1,1 behind fc rgb " << quoteForGnuplot(bgColor) << " fs solid 1.0 noborder\n";
    script << "set title " << quoteForGnuplot(title)
           << " tc rgb " << quoteForGnuplot(titleColor)
           << " font ',14'\n";
    script << "set tmargin 3.4\nset bmargin 4.6\nset lmargin 8.6\nset rmargin 3.2\n";
    script << "set border linewidth " << cfg_.lineWidth << " lc rgb " << quoteForGnuplot(borderColor) << "\n";
    script << "set tics textcolor rgb " << quoteForGnuplot(ticColor) << " font ',10'\n";
    script << "set tics out nomirror\nset mxtics 2\nset mytics 2\n";
    if (cfg_.showGrid) {
        script << "set grid back lc rgb " << quoteForGnuplot(gridColor) << " lw 1 dt 2\n";
    } else {
        script << "unset grid\n";
    }
    script << "set key top right opaque box lc rgb " << quoteForGnuplot(borderColor) << " font ',10'\n";
    return script.str();
}

GnuplotEngine::GnuplotEngine(std::string assetsDir, PlotConfig cfg)
    : assetsDir_(std::move(assetsDir)), cfg_(std::move(cfg)) {
    std::error_code ec;
    std::filesystem::create_directories(assetsDir_, ec);
    if (ec) {
        std::cerr << "[FeedMix][Plot] Could not create asset directory '" << assetsDir_ << "': " << ec.message() << "\n";
    }
}

bool GnuplotEngine::isAvailable() const {
    return !findExecutableInPath("gnuplot").empty();
}

std::string GnuplotEngine::runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent) {
    static const std::string gnuplotExeCached = findExecutableInPath("gnuplot");
    if (gnuplotExeCached.empty()) {
        return "";
    }

    const std::string safeId = sanitizeId(id);
    const std::string dataFile = assetsDir_ + "/" + safeId + ".dat";
    const std::string scriptFile = assetsDir_ + "/" + safeId + ".plt";
    const std::string outputFile = assetsDir_ + "/" + safeId + "." + cfg_.format;
    const std::string errFile = assetsDir_ + "/" + safeId + ".err.log";

    std::ofstream dout(dataFile, std::ios::binary);
    if (!dout) return "";
    dout << dataContent;
    if (!dout.good()) return "";
    dout.close();

    std::ofstream sout(scriptFile, std::ios::binary);
    if (!sout) return "";
    sout << scriptContent;
    if (!sout.good()) return "";
    sout.close();

    const int rc = spawnGnuplot(gnuplotExeCached, scriptFile, errFile);

    std::error_code ec;
    std::filesystem::remove(dataFile, ec);
    std::filesystem::remove(scriptFile, ec);

    if (rc != 0 || !std::filesystem::exists(outputFile)) {
        std::ifstream errIn(errFile);
        std::string firstLine;
        std::getline(errIn, firstLine);
        std::cerr << "[FeedMix][Plot] Generation failed for id='" << safeId
                  << "' rc=" << rc
                  << " output='" << outputFile << "'";
        if (!firstLine.empty()) std::cerr << " stderr='" << firstLine << "'";
        std::cerr << " full_log='" << errFile << "'\n";
        return "";
    }

    std::filesystem::remove(errFile, ec);
    return outputFile;
}

std::string GnuplotEngine::histogramData(const HistogramBinSet& bins) {
    std::ostringstream data;
    data << std::setprecision(10);
    for (const auto& bin : bins.bins) {
        data << bin.midpoint() << " "
             << bin.count << " "
             << (bin.upperEdge - bin.lowerEdge) << " "
             << rgbValue(HistogramBinner::fillColor(bin)) << "\n";
    }
    return data.str();
}

std::string GnuplotEngine::histogramScript(const std::string& id, const HistogramBinSet& bins, const std::string& title) const {
    const std::string safeId = sanitizeId(id);
    const std::string axisColor = (cfg_.theme == "dark") ? "#e5e7eb" : "#374151";
    const std::string edgeColor = (cfg_.theme == "dark") ? "#d1d5db" : "#1f2937";
    const double t = bins.toleranceThreshold;

    double xMin = bins.bins.front().lowerEdge;
    double xMax = bins.bins.back().upperEdge;
    xMin = std::min(xMin, t);
    xMax = std::max(xMax, t);
    const double pad = std::max(1e-6, (xMax - xMin) * 0.04);

    std::ostringstream script;
    script << std::setprecision(10);
    script << styledHeader(id, title);
    script << "set xlabel 'Weighted deviation (%)' tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "set ylabel 'Batches' tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "set xrange [" << (xMin - pad) << ":" << (xMax + pad) << "]\n";
    script << "set yrange [0:*]\n";
    script << "set style fill solid 1.0 border lc rgb " << quoteForGnuplot(edgeColor) << "\n";
    script << "set arrow 1 from " << t << ", graph 0 to " << t << ", graph 1 nohead lc rgb '#2563eb' lw "
           << (cfg_.lineWidth * 1.5) << " dt 2 front\n";
    script << "set label 1 " << quoteForGnuplot("Tolerance " + CommonUtils::formatFixed(t, 1) + "%")
           << " at " << t << ", graph 0.96 offset 0.6,0 tc rgb '#2563eb' font ',10' front\n";
    script << "plot " << quoteForGnuplot(assetsDir_ + "/" + safeId + ".dat")
           << " using 1:2:3:4 with boxes lc rgb variable notitle\n";
    return script.str();
}

std::string GnuplotEngine::histogram(const std::string& id, const HistogramBinSet& bins, const std::string& title) {
    if (bins.empty()) return "";
    return runScript(id, histogramData(bins), histogramScript(id, bins, title));
}
