#pragma once
#include "AnalysisConfig.h"
#include "HistogramBinner.h"
#include <string>

class GnuplotEngine {
public:
    /**
     * @brief Initializes plotting backend and asset directory.
     * @post assets directory is created if possible.
     */
    GnuplotEngine(std::string assetsDir, PlotConfig cfg);

    /**
     * @brief Checks whether gnuplot executable is available in PATH.
     */
    bool isAvailable() const;

    /**
     * @brief Renders pre-computed bins as filled boxes, one fill color per bin, with a
     *        dashed vertical marker at the tolerance threshold.
     * @post Returns output image path, or empty string when gnuplot is missing or fails.
     */
    std::string histogram(const std::string& id, const HistogramBinSet& bins, const std::string& title);

    // "midpoint count width 0xRRGGBB" per bin, the data block histogram() feeds to gnuplot.
    static std::string histogramData(const HistogramBinSet& bins);
    std::string histogramScript(const std::string& id, const HistogramBinSet& bins, const std::string& title) const;

private:
    std::string assetsDir_;
    PlotConfig cfg_;

    static std::string sanitizeId(const std::string& id);
    static std::string quoteForGnuplot(const std::string& value);
    static std::string terminalForFormat(const std::string& format, int width, int height);
    std::string styledHeader(const std::string& id, const std::string& title) const;
    std::string runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent);
};
