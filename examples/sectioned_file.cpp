// ============================================================================
// sectioned_file
// ----------------------------------------------------------------------------
// Shows how podkit pieces compose into a file format:
//
//   [FileHeader][pad][SymbolRecord x N][string table]
//
// The producer interns names, embeds their offsets in fixed-layout records,
// and writes header, records and strings through an aligning Writer.
// The consumer views every section in place: no parsing, no copies.
// ============================================================================

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "podkit.hpp"

#include "common/cli/validators.hpp"


namespace demo {

inline constexpr std::uint32_t MAGIC   = 0x53594D42u; // "BMYS" on little-endian hosts
inline constexpr std::uint16_t VERSION = 1u;

struct FileHeader {
    std::uint32_t magic;
    std::uint16_t version;
    std::uint16_t pad_;
    std::uint32_t record_count;
};
static_assert(sizeof(FileHeader) == 12, "FileHeader must be 12 bytes");

struct SymbolRecord {
    std::uint64_t name_offset;   // offset into the string table section
    std::uint32_t precision;
    std::uint32_t lot_size;
};
static_assert(sizeof(SymbolRecord) == 16, "SymbolRecord must be 16 bytes");
static_assert(alignof(SymbolRecord) == 8, "SymbolRecord must be 8-byte aligned");

} // namespace demo

PODKIT_DECLARE_POD(demo::FileHeader)
PODKIT_DECLARE_POD(demo::SymbolRecord)


namespace demo {

struct Params {
    std::vector<std::string> symbols = {"BTC/USD", "ETH/USD", "BTC/EUR", "BTC/USD"};
    std::string output;
    std::string log_level = "info";
};

bool produce(const std::vector<std::string>& symbols, std::vector<std::uint8_t>& out) {
    podkit::StringTable strings;
    std::vector<SymbolRecord> records;
    records.reserve(symbols.size());

    for (std::size_t i = 0; i < symbols.size(); ++i) {
        std::size_t offset = 0;
        if (auto err = strings.try_insert(symbols[i], offset); err != podkit::Error::None) {
            PK_ERROR("Symbol #" << i << ": " << podkit::describe(err));
            return false;
        }
        records.push_back(SymbolRecord{ offset, static_cast<std::uint32_t>(2 + i), 1u });
    }

    const FileHeader header{ MAGIC, VERSION, 0, static_cast<std::uint32_t>(records.size()) };

    podkit::Writer writer{podkit::vector_sink{}};
    if (writer.write_value(header) != podkit::Error::None) return false;

    const std::size_t pad = writer.align_to_type<SymbolRecord>();
    PK_DEBUG("Header padding: " << pad << " bytes");

    if (writer.write_all(podkit::as_bytes(records)) != podkit::Error::None) return false;
    if (writer.write_all(strings.as_bytes()) != podkit::Error::None) return false;

    PK_INFO("Produced " << writer.position() << " bytes: " << records.size() << " records, "
            << strings.size() << " unique names");
    out = std::move(writer).into_inner().take();
    return true;
}

bool consume(podkit::bytes data) {
    auto head = podkit::view_one_prefix<FileHeader>(data);
    if (!head || head->value->magic != MAGIC || head->value->version != VERSION) {
        PK_ERROR("Not a symbol file");
        return false;
    }

    auto aligned = podkit::align_to_type<SymbolRecord>(head->rest);
    if (!aligned) {
        PK_ERROR("Truncated before records");
        return false;
    }

    auto records = podkit::view_slice_prefix<SymbolRecord>(aligned->suffix, head->value->record_count);
    if (!records) {
        PK_ERROR("Record section is truncated or misaligned");
        return false;
    }

    const podkit::bytes strings = records->rest;
    for (const SymbolRecord& rec : records->items) {
        std::string_view name;
        if (auto err = podkit::StringTable::read(strings, static_cast<std::size_t>(rec.name_offset), name);
            err != podkit::Error::None) {
            PK_ERROR("Record name at offset " << rec.name_offset << ": " << podkit::describe(err));
            return false;
        }
        std::cout << name << "  precision=" << rec.precision << "  lot=" << rec.lot_size
                  << "  (name@" << rec.name_offset << ")\n";
    }
    return true;
}

} // namespace demo


int main(int argc, char** argv) {
    CLI::App app{"Compose a sectioned binary file from podkit primitives"};
    demo::Params params{};

    app.add_option("-s,--symbol", params.symbols, "Symbol name(s) to store (default: a small demo set)");
    app.add_option("-o,--output", params.output, "Also write the produced bytes to this file");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(podkit::examples::cli::log_level_validator)
        ->default_val(params.log_level);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }

    podkit::log::Logger::instance().set_level(params.log_level);

    std::vector<std::uint8_t> file;
    if (!demo::produce(params.symbols, file)) {
        return EXIT_FAILURE;
    }

    if (!params.output.empty()) {
        std::ofstream out(params.output, std::ios::binary);
        out.write(reinterpret_cast<const char*>(file.data()), static_cast<std::streamsize>(file.size()));
        if (!out) {
            PK_ERROR("Failed writing " << params.output);
            return EXIT_FAILURE;
        }
    }

    return demo::consume(file) ? EXIT_SUCCESS : EXIT_FAILURE;
}
