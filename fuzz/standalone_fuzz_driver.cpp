// Standalone fuzz driver for running fuzz targets when libFuzzer is not available
// Feeds each file named on the command line to the target once

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file> [<input_file>...]\n", argv[0]);
        fprintf(stderr, "\nNote: This is a standalone driver for replaying inputs.\n");
        fprintf(stderr, "For actual fuzzing, configure with clang and -DBUILD_FUZZ=ON\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary | std::ios::ate);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            return 1;
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(size));
        if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            fprintf(stderr, "Error: Cannot read file '%s'\n", argv[i]);
            return 1;
        }

        printf("Testing with input file: %s (%lld bytes)\n", argv[i], static_cast<long long>(size));
        int result = LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
        printf("Fuzzer completed successfully (returned %d)\n", result);
    }
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
