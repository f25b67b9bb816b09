#include "test_helpers.hpp"
#include "core/ownership_resolver.hpp"

using namespace slngen;
using namespace slngen::test;

namespace {

ModuleRecord make_module(const std::string& name, const std::string& directory,
                         std::optional<std::string> guid = std::nullopt,
                         std::vector<std::string> references = {}) {
    ModuleRecord record;
    record.name = name;
    record.directory = directory;
    record.guid = std::move(guid);
    record.references = std::move(references);
    return record;
}

const std::string CORE_GUID = "c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0";
const std::string MAIN_GUID = "a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1";

void test_nearest_ancestor_wins() {
    std::cout << "[Test] Nearest bound ancestor owns a directory..." << std::endl;
    OwnershipResolver resolver({make_module("Main", "Assets/Game"), make_module("Core", "Assets/Game/Core")}, {});

    assert(resolver.find_owner("Assets/Game") == std::string("Main"));
    assert(resolver.find_owner("Assets/Game/UI/Widgets") == std::string("Main"));
    assert(resolver.find_owner("Assets/Game/Core") == std::string("Core"));
    assert(resolver.find_owner("Assets/Game/Core/Deep/Deeper") == std::string("Core"));
    assert(!resolver.find_owner("Assets/Other"));
    assert(!resolver.find_owner("Packages/com.foo"));

    // Memoized lookups give the same answers
    assert(resolver.find_owner("Assets/Game/Core/Deep") == std::string("Core"));
    assert(resolver.find_owner("Assets/Game/UI") == std::string("Main"));
    assert(!resolver.find_owner("Assets/Other/Nested"));

    assert(resolver.warnings().empty());
    std::cout << "[Test] PASS" << std::endl;
}

void test_extension_references() {
    std::cout << "[Test] Assembly references resolve by name and GUID..." << std::endl;
    std::vector<ModuleRecord> modules = {
        make_module("Main", "Assets/Game", MAIN_GUID),
        make_module("Core", "Assets/Core", CORE_GUID)
    };
    std::vector<ReferenceExtensionRecord> extensions = {
        {"Assets/Shared/ByName", "Main"},
        {"Assets/Shared/ByPrefixedGuid", "GUID:C0C0C0C0C0C0C0C0C0C0C0C0C0C0C0C0"},
        {"Assets/Shared/ByBareGuid", MAIN_GUID},
        {"Assets/Shared/Dangling", "Missing"},
        {"Assets/Shared/DanglingGuid", "GUID:ffffffffffffffffffffffffffffffff"}
    };
    OwnershipResolver resolver(modules, extensions);

    assert(resolver.find_owner("Assets/Shared/ByName/X") == std::string("Main"));
    assert(resolver.find_owner("Assets/Shared/ByPrefixedGuid") == std::string("Core"));
    assert(resolver.find_owner("Assets/Shared/ByBareGuid") == std::string("Main"));
    assert(!resolver.find_owner("Assets/Shared/Dangling"));
    assert(!resolver.find_owner("Assets/Shared/DanglingGuid"));
    assert(resolver.warnings().empty());

    std::vector<std::string> main_roots = {"Assets/Game", "Assets/Shared/ByBareGuid", "Assets/Shared/ByName"};
    assert(resolver.roots_of("Main") == main_roots);

    assert(resolver.resolve_reference("Core") == std::string("Core"));
    assert(resolver.resolve_reference("GUID:" + CORE_GUID) == std::string("Core"));
    assert(!resolver.resolve_reference("GUID:Core"));
    assert(!resolver.resolve_reference("Unknown"));

    std::cout << "[Test] PASS" << std::endl;
}

void test_co_located_declarations() {
    std::cout << "[Test] A directory keeps its first binding..." << std::endl;
    std::vector<ModuleRecord> modules = {
        make_module("Main", "Assets/Game"),
        make_module("Core", "Assets/Core")
    };
    std::vector<ReferenceExtensionRecord> extensions = {
        {"Assets/Game", "Core"},
        {"Assets/Core", "Core"}
    };
    OwnershipResolver resolver(modules, extensions);

    assert(resolver.find_owner("Assets/Game") == std::string("Main"));
    assert(resolver.warnings().size() == 1);
    assert(has_warning(resolver.warnings(), "Assets/Game"));
    assert(has_warning(resolver.warnings(), "already owned by Main"));

    std::cout << "[Test] PASS" << std::endl;
}

void test_duplicate_module_names() {
    std::cout << "[Test] Duplicate module names are fatal..." << std::endl;
    auto kind = error_kind_of([] {
        OwnershipResolver resolver({make_module("Main", "Assets/A"), make_module("Main", "Assets/B")}, {});
    });
    assert(kind == ErrorKind::DuplicateModuleName);
    std::cout << "[Test] PASS" << std::endl;
}

void test_legacy_fallback() {
    std::cout << "[Test] Legacy directory conventions..." << std::endl;
    assert(OwnershipResolver::legacy_module_for("Assets") == std::string(LEGACY_RUNTIME_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Scripts") == std::string(LEGACY_RUNTIME_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Plugins/Vendor") == std::string(LEGACY_FIRSTPASS_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Standard Assets") == std::string(LEGACY_FIRSTPASS_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Tools/Editor") == std::string(LEGACY_EDITOR_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Editor/Deep") == std::string(LEGACY_EDITOR_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Plugins/Editor") ==
           std::string(LEGACY_EDITOR_FIRSTPASS_MODULE));
    assert(OwnershipResolver::legacy_module_for("Assets/Pro Standard Assets/X/Editor") ==
           std::string(LEGACY_EDITOR_FIRSTPASS_MODULE));

    // First-pass directories only count directly under Assets
    assert(OwnershipResolver::legacy_module_for("Assets/Scripts/Plugins") == std::string(LEGACY_RUNTIME_MODULE));
    // "Editor" must be a whole path component
    assert(OwnershipResolver::legacy_module_for("Assets/EditorTools") == std::string(LEGACY_RUNTIME_MODULE));

    assert(!OwnershipResolver::legacy_module_for("Packages/com.foo"));
    assert(!OwnershipResolver::legacy_module_for(""));
    std::cout << "[Test] PASS" << std::endl;
}

void test_assign() {
    std::cout << "[Test] Source directories are assigned to owners..." << std::endl;
    OwnershipResolver resolver({make_module("Main", "Assets/Game"), make_module("Core", "Assets/Game/Core")}, {});

    std::vector<SourceDirectory> dirs = {
        {"Assets/Game", 2},
        {"Assets/Game/Core", 3},
        {"Assets/Game/Core/Util", 1},
        {"Assets/Scripts", 4},
        {"Assets/Plugins/Editor", 1},
        {"Packages/com.loose/Runtime", 5}
    };
    SourceAssignment assignment = resolver.assign(dirs);

    assert(assignment.dirs_by_module["Main"] == std::vector<std::string>{"Assets/Game"});
    std::vector<std::string> core_dirs = {"Assets/Game/Core", "Assets/Game/Core/Util"};
    assert(assignment.dirs_by_module["Core"] == core_dirs);
    assert(assignment.source_count_by_module["Core"] == 4);
    assert(assignment.source_count_by_module[LEGACY_RUNTIME_MODULE] == 4);
    assert(assignment.source_count_by_module[LEGACY_EDITOR_FIRSTPASS_MODULE] == 1);
    assert(assignment.unresolved_dirs == std::vector<std::string>{"Packages/com.loose/Runtime"});

    size_t total = 0;
    for (const auto& pair : assignment.source_count_by_module) {
        total += pair.second;
    }
    assert(total == 2 + 3 + 1 + 4 + 1);

    std::cout << "[Test] PASS" << std::endl;
}

void test_resolved_references() {
    std::cout << "[Test] Declared references are resolved and de-duplicated..." << std::endl;
    OwnershipResolver resolver({
        make_module("Main", "Assets/Game", MAIN_GUID, {"Core", "GUID:" + CORE_GUID, "Missing", CORE_GUID}),
        make_module("Core", "Assets/Core", CORE_GUID)
    }, {});

    assert(resolver.resolved_references("Main") == std::vector<std::string>{"Core"});
    assert(resolver.resolved_references("Core").empty());
    assert(resolver.resolved_references("Nobody").empty());
    std::cout << "[Test] PASS" << std::endl;
}

} // namespace

int main() {
    test_nearest_ancestor_wins();
    test_extension_references();
    test_co_located_declarations();
    test_duplicate_module_names();
    test_legacy_fallback();
    test_assign();
    test_resolved_references();
    std::cout << "[Test] All ownership resolver tests passed." << std::endl;
    return 0;
}
