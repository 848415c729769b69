#include <brushkit/brushkit.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <brush_file> [out_dir]\n";
    std::cerr << "Prints the brushes in a brush file and saves each one as PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list    List available decoders\n";
    std::cerr << "  -h, --help    Show this help\n";
}

void list_decoders() {
    std::cout << "Available decoders:\n";
    const auto& registry = brushkit::decoder_registry::instance();
    for (std::size_t i = 0; i < registry.decoder_count(); ++i) {
        const auto* decoder = registry.decoder_at(i);
        std::cout << "  " << decoder->name() << " (";
        bool first = true;
        for (const auto& ext : decoder->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
    std::cout << "  " << brushkit::brushset_decoder::name << ", " << brushkit::sut_decoder::name
              << " (container formats, need an archive or database provider)\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

void print_sample(std::size_t index, std::size_t count, const std::string& stem,
                  const brushkit::brush_sample& sample) {
    const auto& px = sample.pixels;
    std::cout << "  [" << index << "] " << px.width() << "x" << px.height();
    if (!px.is_planar()) {
        std::cout << "x" << px.channels();
    }
    std::cout << " " << px.bit_depth() << "-bit";
    if (sample.is_secondary_texture) {
        std::cout << " grain";
    }
    std::cout << " \"" << sample.name.value_or(brushkit::default_sample_name(stem, index, count)) << "\"";
    if (sample.identifier) {
        std::cout << " id=" << *sample.identifier;
    }
    std::cout << "\n";

    if (sample.parameters) {
        for (const auto& entry : *sample.parameters) {
            std::cout << "      " << entry.key << " = " << brushkit::to_string(entry.value) << "\n";
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Check for options
    if (std::strcmp(argv[1], "-l") == 0 || std::strcmp(argv[1], "--list") == 0) {
        list_decoders();
        return 0;
    }

    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    const std::filesystem::path input_path(argv[1]);

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    // Read input file
    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    const auto extension = input_path.extension().string();
    const auto format = brushkit::format_for_extension(extension);
    if (format == brushkit::brush_format::brushset || format == brushkit::brush_format::sut ||
        brushkit::brushset_decoder::sniff(data) || brushkit::sut_decoder::sniff(data)) {
        std::cerr << "Error: " << input_path << " is a container brush file; "
                  << "decoding it needs an archive or database provider\n";
        return 1;
    }

    // Find decoder by extension, then by checking the data
    const auto* decoder = brushkit::decoder_registry::instance().find_decoder_for_extension(extension, data);
    if (!decoder) {
        std::cerr << "Error: Unknown brush format: " << input_path << "\n";
        return 1;
    }

    std::cout << "Detected format: " << decoder->name() << "\n";

    brushkit::parsed_brush_file brushes;
    auto result = decoder->parse(data, brushes, {});
    if (!result) {
        std::cerr << "Error: Failed to decode: " << result.message << "\n";
        return 1;
    }

    for (const auto& failure : brushes.member_failures) {
        std::cerr << "Warning: Skipped " << brushkit::to_string(failure.error) << ": "
                  << failure.message << "\n";
    }

    std::cout << "Version: " << brushes.version.major << "." << brushes.version.minor << "\n";
    std::cout << "Samples: " << brushes.samples.size() << "\n";

    const std::string stem = input_path.stem().string();
    const std::size_t count = brushes.samples.size();
    for (std::size_t i = 0; i < count; ++i) {
        print_sample(i, count, stem, brushes.samples[i]);
    }

    // Use second argument as output directory, or the input's directory
    const std::filesystem::path out_dir = argc >= 3 ? std::filesystem::path(argv[2])
                                                    : input_path.parent_path();
    if (!out_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(out_dir, ec);
        if (ec) {
            std::cerr << "Error: Failed to create " << out_dir << ": " << ec.message() << "\n";
            return 1;
        }
    }

    int failed = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const auto& pixels = brushes.samples[i].pixels;
        if (pixels.empty()) {
            continue;
        }
        const auto output_path = out_dir / (stem + "_" + std::to_string(i) + ".png");
        if (!brushkit::save_png(pixels, output_path)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            ++failed;
            continue;
        }
        std::cout << "Saved: " << output_path << "\n";
    }

    return failed == 0 ? 0 : 1;
}
