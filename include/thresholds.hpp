#pragma once

#include "language.hpp"

// Four ascending cut points; values at or below excellent score 100
struct ThresholdConfig {
    double excellent = 0.0;
    double good = 0.0;
    double acceptable = 0.0;
    double poor = 0.0;
};

struct LanguageThresholds {
    ThresholdConfig cyclomaticComplexity;
    ThresholdConfig cognitiveComplexity;
    ThresholdConfig functionLength;
    ThresholdConfig fileLength;          // Code lines
    ThresholdConfig parameterCount;
    ThresholdConfig nestingDepth;
};

// Thresholds for a language; JavaScript's table serves TypeScript and unknown languages
const LanguageThresholds& getLanguageThresholds(Language language);
