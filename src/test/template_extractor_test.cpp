#include "test_helpers.hpp"
#include "common/generator.hpp"
#include "core/solution_planner.hpp"
#include "generators/descriptor_renderer.hpp"
#include "generators/template_extractor.hpp"
#include "parsers/manifest_io.hpp"
#include "parsers/sln_reader.hpp"

using namespace slngen;
using namespace slngen::test;

namespace {

const std::string TEMPLATES = std::string(SLNGEN_DEFAULT_TEMPLATE_ROOT) + "/templates/";
const std::string MAIN_PROJECT_GUID = "{0D6D4E1A-1111-2222-3333-444455556666}";
const std::string CORE_PROJECT_GUID = "{7B2C9F00-AAAA-BBBB-CCCC-DDDDEEEEFFFF}";
const std::string EDITOR_PROJECT_GUID = "{5E5E5E5E-1234-5678-9ABC-DEF012345678}";

// A .csproj the way the Unity editor writes it
std::string unity_csproj(const std::string& root, const std::string& sources, const std::string& references) {
    return
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<Project ToolsVersion=\"4.0\" DefaultTargets=\"Build\" "
        "xmlns=\"http://schemas.microsoft.com/developer/msbuild/2003\">\n"
        "  <!-- Generated file, do not modify, your changes will be overwritten (use AssetPostprocessor.OnGeneratedCSProject) -->\n"
        "  <PropertyGroup>\n"
        "    <LangVersion>9.0</LangVersion>\n"
        "    <UnityVersion>" + std::string(UNITY_VERSION) + "</UnityVersion>\n"
        "    <ProjectRoot>" + root + "</ProjectRoot>\n"
        "  </PropertyGroup>\n"
        "  <!--\n"
        "    Analyzer settings\n"
        "  -->\n"
        "  <ItemGroup>\n" + sources +
        "    <None Include=\"Assets/Game/Main.asmdef\" />\n"
        "  </ItemGroup>\n"
        "  <ItemGroup>\n"
        "    <Reference Include=\"UnityEngine\">\n"
        "      <HintPath>/Applications/Unity/Hub/Editor/" + std::string(UNITY_VERSION) + "/UnityEngine.dll</HintPath>\n"
        "    </Reference>\n"
        "  </ItemGroup>\n"
        "  <ItemGroup>\n" + references +
        "  </ItemGroup>\n"
        "</Project>\n";
}

std::string unity_sln() {
    return
        "\n"
        "Microsoft Visual Studio Solution File, Format Version 11.00\n"
        "# Visual Studio 2010\n"
        "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Main\", \"Main.csproj\", \"" + MAIN_PROJECT_GUID + "\"\n"
        "EndProject\n"
        "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Core\", \"Core.csproj\", \"" + CORE_PROJECT_GUID + "\"\n"
        "EndProject\n"
        "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Assembly-CSharp-Editor\", "
        "\"Assembly-CSharp-Editor.csproj\", \"" + EDITOR_PROJECT_GUID + "\"\n"
        "EndProject\n"
        "Global\n"
        "\tGlobalSection(SolutionConfigurationPlatforms) = preSolution\n"
        "\t\tDebug|Any CPU = Debug|Any CPU\n"
        "\tEndGlobalSection\n"
        "\tGlobalSection(ProjectConfigurationPlatforms) = postSolution\n"
        "\t\t" + MAIN_PROJECT_GUID + ".Debug|Any CPU.ActiveCfg = Debug|Any CPU\n"
        "\t\t" + MAIN_PROJECT_GUID + ".Debug|Any CPU.Build.0 = Debug|Any CPU\n"
        "\t\t" + CORE_PROJECT_GUID + ".Debug|Any CPU.ActiveCfg = Debug|Any CPU\n"
        "\t\t" + CORE_PROJECT_GUID + ".Debug|Any CPU.Build.0 = Debug|Any CPU\n"
        "\t\t" + EDITOR_PROJECT_GUID + ".Debug|Any CPU.ActiveCfg = Debug|Any CPU\n"
        "\t\t" + EDITOR_PROJECT_GUID + ".Debug|Any CPU.Build.0 = Debug|Any CPU\n"
        "\tEndGlobalSection\n"
        "\tGlobalSection(SolutionProperties) = preSolution\n"
        "\t\tHideSolutionNode = FALSE\n"
        "\tEndGlobalSection\n"
        "EndGlobal\n";
}

// Unity project as the editor leaves it: sources, asmdefs, .sln and .csproj files
void write_unity_project(const TempProject& project) {
    write_project_version(project);
    project.write("Assets/Game/Main.asmdef", asmdef("Main", {"Core"}));
    project.write("Assets/Game/Foo.cs", "class Foo {}");
    project.write("Assets/Game/Core/Core.asmdef", asmdef("Core"));
    project.write("Assets/Game/Core/Bar.cs", "class Bar {}");
    project.write("Assets/Editor/Tool.cs", "class Tool {}");

    project.write("MyGame.sln", unity_sln());
    project.write("AAA.v.ios-prod.sln", "stale variant solution");
    project.write("Main.csproj", unity_csproj(project.root(),
        "    <Compile Include=\"Assets/Game/Foo.cs\" />\n",
        "    <ProjectReference Include=\"Core.csproj\">\n"
        "      <Project>" + CORE_PROJECT_GUID + "</Project>\n"
        "      <Name>Core</Name>\n"
        "    </ProjectReference>\n"));
    project.write("Core.csproj", unity_csproj(project.root(),
        "    <Compile Include=\"Assets/Game/Core/Bar.cs\" />\n", ""));
    project.write("Assembly-CSharp-Editor.csproj", unity_csproj(project.root(),
        "    <Compile Include=\"Assets/Editor/Tool.cs\" />\n", ""));
}

void test_templatize_csproj() {
    std::cout << "[Test] Unity .csproj files become templates..." << std::endl;
    const std::string root = "/work/MyGame";
    std::string csproj = unity_csproj(root,
        "    <Compile Include=\"Assets/Game/Foo.cs\" />\n"
        "    <Compile Include=\"Assets/Game/UI/Panel.cs\" />\n",
        "    <ProjectReference Include=\"Core.csproj\">\n"
        "      <Project>{AAAA}</Project>\n"
        "      <Name>Core</Name>\n"
        "    </ProjectReference>\n"
        "    <ProjectReference Include=\"Util.csproj\" />\n");

    std::string expected =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<Project ToolsVersion=\"4.0\" DefaultTargets=\"Build\" "
        "xmlns=\"http://schemas.microsoft.com/developer/msbuild/2003\">\n"
        "  <PropertyGroup>\n"
        "    <LangVersion>9.0</LangVersion>\n"
        "    <UnityVersion>{{UNITY_VER}}</UnityVersion>\n"
        "    <ProjectRoot>{{PROJECT_ROOT}}</ProjectRoot>\n"
        "  </PropertyGroup>\n"
        "  <ItemGroup>\n"
        "    {{SOURCE_FOLDERS}}\n"
        "  </ItemGroup>\n"
        "  <ItemGroup>\n"
        "    <Reference Include=\"UnityEngine\">\n"
        "      <HintPath>/Applications/Unity/Hub/Editor/{{UNITY_VER}}/UnityEngine.dll</HintPath>\n"
        "    </Reference>\n"
        "  </ItemGroup>\n"
        "  <ItemGroup>\n"
        "    {{PROJECT_REFERENCES}}\n"
        "  </ItemGroup>\n"
        "</Project>\n";

    assert(TemplateExtractor::templatize_csproj(csproj, root, UNITY_VERSION) == expected);
    std::cout << "[Test] PASS" << std::endl;
}

void test_templatize_sln() {
    std::cout << "[Test] Solution templates reproduce the solution they came from..." << std::endl;
    std::string sln = unity_sln();
    std::string tmpl = TemplateExtractor::templatize_sln(sln, CSHARP_PROJECT_TYPE_GUID);

    assert(contains_text(tmpl, "# Visual Studio 2010\n{{PROJECT_ENTRIES}}\nGlobal\n"));
    assert(contains_text(tmpl, "postSolution\n{{PROJECT_CONFIGS}}\n\tEndGlobalSection\n"));
    assert(contains_text(tmpl, "\t\tDebug|Any CPU = Debug|Any CPU\n"));
    assert(contains_text(tmpl, "HideSolutionNode = FALSE"));
    assert(!contains_text(tmpl, MAIN_PROJECT_GUID));

    GeneratorManifest manifest;
    for (const auto& entry : SlnReader().parse_projects(sln)) {
        ProjectEntry project;
        project.name = entry.name;
        project.csproj_path = entry.path;
        project.guid = entry.guid;
        manifest.projects.push_back(project);
    }
    assert(DescriptorRenderer::render_solution(manifest, tmpl) == sln);
    std::cout << "[Test] PASS" << std::endl;
}

void test_extract_templates() {
    std::cout << "[Test] Extracting templates from a Unity project..." << std::endl;
    TempProject project("extract_templates");
    write_unity_project(project);

    TemplateExtractor extractor(options_for(project));
    std::vector<std::string> updated = extractor.extract();
    std::vector<std::string> expected = {
        TEMPLATES + "Assembly-CSharp-Editor.csproj.template",
        TEMPLATES + "Core.csproj.template",
        TEMPLATES + "Main.csproj.template",
        TEMPLATES + "MyGame.sln.template"
    };
    assert(updated == expected);

    std::string main_template = project.read(TEMPLATES + "Main.csproj.template");
    assert(contains_text(main_template, "<ProjectRoot>{{PROJECT_ROOT}}</ProjectRoot>"));
    assert(contains_text(main_template, "    {{SOURCE_FOLDERS}}\n"));
    assert(contains_text(main_template, "    {{PROJECT_REFERENCES}}\n"));
    assert(!contains_text(main_template, project.root()));
    assert(!contains_text(main_template, "Foo.cs"));

    // Nothing changed, nothing written
    assert(extractor.extract().empty());

    // The extracted templates drive generation
    GenerateOptions options = options_for(project);
    auto generator = GeneratorFactory::instance().create("csproj");
    GenerateResult result = generator->generate(SolutionPlanner(options).plan(), options);
    assert(!result.updated_files.empty());

    assert(compile_set(project, "Main.csproj") == std::set<std::string>{"Assets/Game/Foo.cs"});
    assert(compile_set(project, "Core.csproj") == std::set<std::string>{"Assets/Game/Core/Bar.cs"});
    assert(compile_set(project, "Assembly-CSharp-Editor.csproj") == std::set<std::string>{"Assets/Editor/Tool.cs"});
    std::string main_csproj = project.read("Main.csproj");
    assert(contains_text(main_csproj, "<ProjectRoot>" + project.root() + "</ProjectRoot>"));
    assert(contains_text(main_csproj, "<ProjectReference Include=\"Core.csproj\">"));

    std::cout << "[Test] PASS" << std::endl;
}

void test_extracted_solution_name_is_kept() {
    std::cout << "[Test] Generation reuses the name of the solution templates came from..." << std::endl;
    TempProject project("extract_solution_name");
    write_unity_project(project);
    fs::rename(project.path("MyGame.sln"), project.path("Studio.sln"));

    TemplateExtractor(options_for(project)).extract();
    assert(project.exists(TEMPLATES + "Studio.sln.template"));
    assert(!project.exists(TEMPLATES + "MyGame.sln.template"));

    GenerateOptions options = options_for(project);
    SolutionPlan plan = SolutionPlanner(options).plan();
    assert(plan.manifest.solution_path == "Studio.sln");
    assert(plan.manifest.solution_template_path == TEMPLATES + "Studio.sln.template");

    auto generator = GeneratorFactory::instance().create("csproj");
    GenerateResult result = generator->generate(plan, options);
    assert(std::find(result.updated_files.begin(), result.updated_files.end(), "Studio.sln") !=
           result.updated_files.end());
    assert(!project.exists("MyGame.sln"));
    assert(contains_text(project.read("Studio.sln"), "\"Main.csproj\""));

    std::cout << "[Test] PASS" << std::endl;
}

void test_missing_project_file_is_skipped() {
    std::cout << "[Test] Solution entries without a project file are skipped..." << std::endl;
    TempProject project("extract_missing_csproj");
    write_unity_project(project);
    fs::remove(project.path("Core.csproj"));

    std::vector<std::string> updated = TemplateExtractor(options_for(project)).extract();
    assert(updated.size() == 3);
    assert(!project.exists(TEMPLATES + "Core.csproj.template"));
    std::cout << "[Test] PASS" << std::endl;
}

void test_init_manifest() {
    std::cout << "[Test] Writing a project registry from the solution..." << std::endl;
    TempProject project("extract_manifest");
    write_unity_project(project);

    GenerateOptions options = options_for(project);
    TemplateExtractor extractor(options);
    extractor.extract();
    std::string manifest_path = extractor.init_manifest(std::string(SLNGEN_DEFAULT_TEMPLATE_ROOT) + "/manifest.json");
    assert(manifest_path == project.path(std::string(SLNGEN_DEFAULT_TEMPLATE_ROOT) + "/manifest.json").generic_string());

    GeneratorManifest manifest = load_manifest(manifest_path);
    assert(manifest.solution_path == "MyGame.sln");
    assert(manifest.solution_template_path == TEMPLATES + "MyGame.sln.template");
    assert(manifest.project_type_guid == CSHARP_PROJECT_TYPE_GUID);
    assert(manifest.projects.size() == 3);

    const ProjectEntry& main_entry = manifest.projects[0];
    assert(main_entry.name == "Main");
    assert(main_entry.csproj_path == "Main.csproj");
    assert(main_entry.template_path == TEMPLATES + "Main.csproj.template");
    assert(main_entry.guid == MAIN_PROJECT_GUID);
    assert(main_entry.kind == ProjectKind::AsmDef);
    assert(main_entry.category == ProjectCategory::Runtime);

    const ProjectEntry& editor = manifest.projects[2];
    assert(editor.name == "Assembly-CSharp-Editor");
    assert(editor.kind == ProjectKind::Legacy);
    assert(editor.category == ProjectCategory::Editor);

    // Registry-driven generation keeps the solution's GUIDs
    options.manifest_path = std::string(SLNGEN_DEFAULT_TEMPLATE_ROOT) + "/manifest.json";
    auto generator = GeneratorFactory::instance().create("csproj");
    generator->generate(SolutionPlanner(options).plan(), options);

    std::string sln = project.read("MyGame.sln");
    assert(contains_text(sln, "\"Core\", \"Core.csproj\", \"" + CORE_PROJECT_GUID + "\""));
    assert(contains_text(project.read("Main.csproj"), "<Project>" + CORE_PROJECT_GUID + "</Project>"));
    assert(compile_set(project, "Assembly-CSharp-Editor.csproj") == std::set<std::string>{"Assets/Editor/Tool.cs"});

    // Re-running over an unchanged tree leaves the registry alone
    auto before = fs::last_write_time(manifest_path);
    extractor.init_manifest(std::string(SLNGEN_DEFAULT_TEMPLATE_ROOT) + "/manifest.json");
    assert(fs::last_write_time(manifest_path) == before);

    std::cout << "[Test] PASS" << std::endl;
}

void test_solution_errors() {
    std::cout << "[Test] Projects without a usable solution are rejected..." << std::endl;
    TempProject project("extract_errors");
    project.write("Assets/Game/Main.asmdef", asmdef("Main"));

    TemplateExtractor extractor(options_for(project));
    assert(error_kind_of([&] { extractor.extract(); }) == ErrorKind::NoSolutionFound);

    // Variant solutions are never picked up
    project.write("MyGame.v.ios-prod.sln", unity_sln());
    assert(error_kind_of([&] { extractor.extract(); }) == ErrorKind::NoSolutionFound);

    project.write("MyGame.sln",
        "Microsoft Visual Studio Solution File, Format Version 11.00\n"
        "Project(\"{2150E333-8FDC-42A3-9474-1A3956D46DE8}\") = \"Folder\", \"Folder\", \"{11111111-2222-3333-4444-555555555555}\"\n"
        "EndProject\n"
        "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Nested\", \"Sub/Nested.csproj\", \"{22222222-2222-3333-4444-555555555555}\"\n"
        "EndProject\n");
    assert(error_kind_of([&] { extractor.extract(); }) == ErrorKind::NoProjectsInSolution);
    assert(error_kind_of([&] { extractor.init_manifest("manifest.json"); }) == ErrorKind::NoProjectsInSolution);
    assert(!project.exists("manifest.json"));

    std::cout << "[Test] PASS" << std::endl;
}

} // namespace

int main() {
    test_templatize_csproj();
    test_templatize_sln();
    test_extract_templates();
    test_extracted_solution_name_is_kept();
    test_missing_project_file_is_skipped();
    test_init_manifest();
    test_solution_errors();
    std::cout << "[Test] All template extraction tests passed." << std::endl;
    return 0;
}
