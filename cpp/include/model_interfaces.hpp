#pragma once

#include "outfit_types.hpp"

#include <string>
#include <vector>

namespace Fitcast {

// Garment detector. Returns raw class ids; the analyzer maps them to ItemClass.
class IDetectorModel {
public:
    virtual ~IDetectorModel() = default;

    virtual std::vector<RawDetection> detect(const std::string& imagePath) = 0;
    virtual bool isAvailable() const = 0;
};

// Image/text similarity in [-1, 1]
class ISimilarityModel {
public:
    virtual ~ISimilarityModel() = default;

    virtual double similarity(const std::string& imagePath, const std::string& prompt) = 0;
    virtual bool isAvailable() const = 0;

    // One score per prompt, in prompt order. Backends override this to read the image once.
    virtual std::vector<double> similarities(const std::string& imagePath,
                                             const std::vector<std::string>& prompts) {
        std::vector<double> scores;
        scores.reserve(prompts.size());
        for (const auto& prompt : prompts) {
            scores.push_back(similarity(imagePath, prompt));
        }
        return scores;
    }
};

class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;

    // Empty string or an exception means no usable answer
    virtual std::string generate(const std::string& prompt) = 0;
    virtual bool isAvailable() const = 0;
};

} // namespace Fitcast
