/**
 * @file tagid_tool.cpp
 * @brief Command-line front end: generate, parse and convert typed identifiers
 *
 * Usage:
 *   tagid_tool [--manifest FILE] new <tag> [count]
 *   tagid_tool [--manifest FILE] parse <text>
 *   tagid_tool [--manifest FILE] short <text>
 *   tagid_tool [--manifest FILE] long <text>
 *   tagid_tool [--manifest FILE] tags
 *   tagid_tool --manifest FILE declare <tag> <DisplayName>
 *   tagid_tool --manifest FILE undeclare <tag>
 *
 * parse/short/long resolve the tag through the registry, so the kind must
 * be declared in the manifest. declare creates the manifest if needed.
 */

#include <tagid/auto_parser.hpp>
#include <tagid/errors.hpp>
#include <tagid/kind_manifest.hpp>
#include <tagid/log.hpp>
#include <tagid/type_registry.hpp>
#include <tagid/typed_id.hpp>

#include <cctype>
#include <charconv>
#include <iostream>
#include <string>
#include <vector>

using namespace tagid;

namespace {

void printUsage() {
    std::cerr << "Usage: tagid_tool [--manifest FILE] <command> [args]\n"
              << "Commands:\n"
              << "  new <tag> [count]   generate identifiers\n"
              << "  parse <text>        show every form of an identifier\n"
              << "  short <text>        convert to short form\n"
              << "  long <text>         convert to canonical form\n"
              << "  tags                list registered tags\n"
              << "  declare <tag> <Name>  add a kind to the manifest\n"
              << "  undeclare <tag>     remove a kind from the manifest\n";
}

std::string displayNameFor(const std::string& tag) {
    std::string name = tag;
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

int runNew(TypeRegistry& registry, const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 2;
    }

    int count = 1;
    if (args.size() > 1) {
        const auto& text = args[1];
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
        if (ec != std::errc() || end != text.data() + text.size() || count < 1) {
            std::cerr << "ERROR: invalid count '" << text << "'\n";
            return 2;
        }
    }

    // Tags not declared in the manifest get a display name derived from the tag
    const IdKind* kind = registry.find(args[0]);
    if (kind == nullptr) {
        kind = &registry.registerOrGet(displayNameFor(args[0]), std::string_view(args[0]));
    }

    for (int i = 0; i < count; ++i) {
        TypedId id = TypedId::generate(*kind);
        std::cout << id << "  " << id.shortString() << "\n";
    }
    return 0;
}

int runEditManifest(const std::string& manifest, const std::string& command,
                    const std::vector<std::string>& args) {
    if (manifest.empty()) {
        std::cerr << "ERROR: " << command << " requires --manifest FILE\n";
        return 2;
    }
    if (command == "declare") {
        if (args.size() != 2) {
            printUsage();
            return 2;
        }
        return declareKind(manifest, args[1], args[0]) ? 0 : 1;
    }
    if (args.size() != 1) {
        printUsage();
        return 2;
    }
    return undeclareKind(manifest, args[0]) ? 0 : 1;
}

int runParse(const TypeRegistry& registry, const std::string& text) {
    TypedId id = parseTypedId(text, registry);
    std::cout << "kind:      " << id.kind().typeName() << "\n"
              << "canonical: " << id << "\n"
              << "short:     " << id.shortString() << "\n"
              << "uuid:      " << id.uuidString() << "\n"
              << "debug:     " << id.debugString() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto& registry = TypeRegistry::global();

    std::string manifest;
    if (args.size() >= 2 && args[0] == "--manifest") {
        manifest = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        printUsage();
        return 2;
    }

    const std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "declare" || command == "undeclare") {
        return runEditManifest(manifest, command, rest);
    }

    if (!manifest.empty() && loadKindManifest(manifest, registry) < 0) {
        std::cerr << "ERROR: could not load manifest '" << manifest << "'\n";
        return 1;
    }

    try {
        if (command == "new") {
            return runNew(registry, rest);
        }
        if (command == "tags") {
            for (const auto& tag : registry.listTags()) {
                std::cout << tag << "  " << registry.find(tag)->typeName() << "\n";
            }
            return 0;
        }
        if (rest.size() != 1) {
            printUsage();
            return 2;
        }
        if (command == "parse") {
            return runParse(registry, rest[0]);
        }
        if (command == "short") {
            std::cout << parseTypedId(rest[0], registry).shortString() << "\n";
            return 0;
        }
        if (command == "long") {
            std::cout << parseTypedId(rest[0], registry) << "\n";
            return 0;
        }
    } catch (const TypedIdError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "ERROR: unknown command '" << command << "'\n";
    printUsage();
    return 2;
}
