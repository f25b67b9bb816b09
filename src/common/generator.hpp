#pragma once

#include "project_types.hpp"
#include <functional>
#include <memory>

namespace slngen {

// Abstract base class for descriptor generators
class Generator {
public:
    virtual ~Generator() = default;

    // Render and write every descriptor of the plan.
    // Throws GeneratorError before writing anything if a template is missing.
    virtual GenerateResult generate(const SolutionPlan& plan, const GenerateOptions& options) = 0;

    // Name accepted by -g
    virtual std::string name() const = 0;

    // One-line summary for -l
    virtual std::string description() const = 0;
};

// Name -> generator lookup behind -g
class GeneratorFactory {
public:
    using GeneratorCreator = std::function<std::unique_ptr<Generator>()>;

    // Get the singleton instance
    static GeneratorFactory& instance() {
        static GeneratorFactory factory;
        return factory;
    }

    // Register a generator
    void register_generator(const std::string& name, GeneratorCreator creator) {
        generators_[name] = creator;
    }

    // nullptr for names nothing registered
    std::unique_ptr<Generator> create(const std::string& name) const {
        auto it = generators_.find(name);
        if (it == generators_.end()) {
            return nullptr;
        }
        return it->second();
    }

    // Registered names, sorted (listed by -l)
    std::vector<std::string> available_generators() const {
        std::vector<std::string> names;
        for (const auto& pair : generators_) {
            names.push_back(pair.first);
        }
        return names;
    }

private:
    GeneratorFactory() = default;
    std::map<std::string, GeneratorCreator> generators_;
};

// Helper class to auto-register generators
template<typename T>
class GeneratorRegistrar {
public:
    explicit GeneratorRegistrar(const std::string& name) {
        GeneratorFactory::instance().register_generator(name, []() {
            return std::make_unique<T>();
        });
    }
};

// Macro to easily register a generator
#define REGISTER_GENERATOR(ClassName, name) \
    static slngen::GeneratorRegistrar<ClassName> g_registrar_##ClassName(name);

} // namespace slngen
