// ============================================================================
// string_table_tool
// ----------------------------------------------------------------------------
// Builds, inspects and queries serialized string tables.
//
//   string_table_tool build  -i words.txt -o words.strtab   (one string per line)
//   string_table_tool dump   words.strtab
//   string_table_tool lookup words.strtab --offset 4
// ============================================================================

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "podkit/string_table.hpp"
#include "podkit/writer.hpp"
#include "podkit/log/logger.hpp"

#include "common/cli/validators.hpp"


namespace {

struct Params {
    std::string log_level = "warn";
    std::string input;
    std::string output;
    std::string table;
    std::uint64_t offset = 0;
};

bool load_file(const std::string& path, std::vector<std::uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        PK_ERROR("Cannot open " << path);
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

int run_build(const Params& p) {
    std::ifstream in(p.input);
    if (!in) {
        PK_ERROR("Cannot open " << p.input);
        return EXIT_FAILURE;
    }

    podkit::StringTable table;
    std::size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lines;
        std::size_t offset = 0;
        if (auto err = table.try_insert(line, offset); err != podkit::Error::None) {
            PK_ERROR(p.input << ":" << lines << ": " << podkit::describe(err));
            return EXIT_FAILURE;
        }
        PK_DEBUG("line " << lines << " -> offset " << offset);
    }

    std::ofstream out(p.output, std::ios::binary);
    podkit::Writer writer{podkit::ostream_sink{out}};
    if (writer.write_all(table.as_bytes()) != podkit::Error::None || writer.flush() != podkit::Error::None) {
        PK_ERROR("Failed writing " << p.output);
        return EXIT_FAILURE;
    }

    PK_INFO("Wrote " << table.size() << " unique strings (" << lines << " lines, "
            << writer.position() << " bytes) to " << p.output);
    return EXIT_SUCCESS;
}

int run_dump(const Params& p) {
    std::vector<std::uint8_t> raw;
    if (!load_file(p.table, raw)) {
        return EXIT_FAILURE;
    }

    podkit::StringTable table;
    if (auto err = podkit::StringTable::from_bytes(raw, table); err != podkit::Error::None) {
        PK_ERROR(p.table << ": " << podkit::describe(err));
        return EXIT_FAILURE;
    }

    table.for_each_entry([](std::size_t offset, std::string_view s) {
        std::cout << offset << '\t' << s << '\n';
    });

    std::cout << "# " << table.size() << " strings, " << table.byte_size() << " bytes, memory ";
    table.memory_usage().dump(std::cout);
    std::cout << '\n';
    return EXIT_SUCCESS;
}

int run_lookup(const Params& p) {
    std::vector<std::uint8_t> raw;
    if (!load_file(p.table, raw)) {
        return EXIT_FAILURE;
    }

    std::string_view s;
    if (auto err = podkit::StringTable::read(raw, static_cast<std::size_t>(p.offset), s); err != podkit::Error::None) {
        PK_ERROR("offset " << p.offset << ": " << podkit::describe(err));
        return EXIT_FAILURE;
    }
    std::cout << s << '\n';
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char** argv) {
    CLI::App app{"Build, dump and query podkit string tables"};
    Params params{};

    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(podkit::examples::cli::log_level_validator)
        ->default_val(params.log_level);
    app.require_subcommand(1);

    auto* build = app.add_subcommand("build", "Intern every line of a text file");
    build->add_option("-i,--input", params.input, "Input text file (UTF-8, one string per line)")->required();
    build->add_option("-o,--output", params.output, "Output table file")->required();

    auto* dump = app.add_subcommand("dump", "List every string with its offset");
    dump->add_option("table", params.table, "Table file")->required();

    auto* lookup = app.add_subcommand("lookup", "Resolve one offset");
    lookup->add_option("table", params.table, "Table file")->required();
    lookup->add_option("--offset", params.offset, "Entry offset")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }

    podkit::log::Logger::instance().set_level(params.log_level);

    if (build->parsed())  return run_build(params);
    if (dump->parsed())   return run_dump(params);
    if (lookup->parsed()) return run_lookup(params);
    return EXIT_FAILURE;
}
