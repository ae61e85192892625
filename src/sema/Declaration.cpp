/***
 * Name: spindle::sema::Declaration (impl)
 * Purpose: Constructors and lookup for declarations.
 */
#include "sema/Declaration.h"
#include "sema/Diagnostic.h"

#include <utility>

namespace spindle::sema {

const char* to_string(const Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
        default: return "unknown";
    }
}

const char* to_string(const DeclarationSource s) {
    switch (s) {
        case DeclarationSource::Explicit: return "explicit";
        case DeclarationSource::Inferred: return "inferred";
        case DeclarationSource::Derived: return "derived";
        case DeclarationSource::External: return "external";
        default: return "unknown";
    }
}

Declaration Declaration::variable(std::string name, const rt::ValueType t, std::optional<rt::Value> def,
                                  const DeclarationSource source) {
    Declaration d;
    d.name = std::move(name);
    d.type = t;
    d.defaultValue = std::move(def);
    d.source = source;
    return d;
}

Declaration Declaration::function(std::string name, rt::FunctionSignature sig, const DeclarationSource source) {
    Declaration d;
    d.name = std::move(name);
    d.type = std::move(sig);
    d.source = source;
    return d;
}

const Declaration* findDeclaration(const std::vector<Declaration>& decls, const std::string& name) {
    for (const auto& d : decls) {
        if (d.name == name) { return &d; }
    }
    return nullptr;
}

} // namespace spindle::sema
