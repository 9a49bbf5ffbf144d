#pragma once

#include "ztredact/config.h"
#include "ztredact/entity_recognizer.h"
#include "ztredact/gazetteer.h"
#include "ztredact/pattern_rules.h"
#include "ztredact/types.h"

#include <memory>
#include <string>
#include <vector>

namespace ztredact {

// Every variant scans the same pristine canonical text. detect() is const,
// never mutates its input, and may throw; the orchestrator turns a throw into
// zero findings for that variant.
class Detector {
public:
    virtual ~Detector() = default;
    virtual const char* name() const = 0;
    virtual DetectorKind kind() const = 0;
    virtual Findings detect(const std::string &text) const = 0;
};

// ---------------- Statistical NER ----------------
class NerDetector : public Detector {
public:
    explicit NerDetector(std::shared_ptr<const EntityRecognizer> recognizer,
                         CancellationToken cancel = CancellationToken())
        : recognizer_(std::move(recognizer)), cancel_(std::move(cancel)) {}
    const char* name() const override { return "statistical-ner"; }
    DetectorKind kind() const override { return DetectorKind::NER; }
    Findings detect(const std::string &text) const override;

    static EntityKind map_label(const std::string &label);

private:
    std::shared_ptr<const EntityRecognizer> recognizer_;
    CancellationToken cancel_;
};

// ---------------- Deterministic pattern ----------------
class PatternDetector : public Detector {
public:
    explicit PatternDetector(const PatternConfig &cfg);
    const char* name() const override { return "deterministic-pattern"; }
    DetectorKind kind() const override { return DetectorKind::PATTERN; }
    Findings detect(const std::string &text) const override;

private:
    size_t window_;
    std::vector<PatternRule> rules_;
};

// ---------------- Contextual ----------------
class ContextualDetector : public Detector {
public:
    enum class Shape { DATE, NAME, PLACE, IDENTIFIER };

    struct Trigger {
        std::vector<std::string> words;   // lower-case token sequence
        EntityKind kind;
        Shape shape;
    };

    explicit ContextualDetector(const ContextualConfig &cfg);
    const char* name() const override { return "contextual"; }
    DetectorKind kind() const override { return DetectorKind::CONTEXTUAL; }
    Findings detect(const std::string &text) const override;

    static const std::vector<Trigger>& default_triggers();

private:
    ContextualConfig cfg_;
};

// ---------------- Fuzzy gazetteer match ----------------
class FuzzyDetector : public Detector {
public:
    FuzzyDetector(const FuzzyConfig &cfg, std::shared_ptr<const Gazetteer> gazetteer)
        : cfg_(cfg), gazetteer_(std::move(gazetteer)) {}
    const char* name() const override { return "fuzzy-match"; }
    DetectorKind kind() const override { return DetectorKind::FUZZY; }
    Findings detect(const std::string &text) const override;

private:
    FuzzyConfig cfg_;
    std::shared_ptr<const Gazetteer> gazetteer_;
};

} // namespace ztredact
