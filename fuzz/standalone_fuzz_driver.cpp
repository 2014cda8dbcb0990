// Runs a fuzz target over input files when libFuzzer is not available

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char **argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
        fprintf(stderr, "\nReplays corpus files through the fuzz target once each.\n");
        fprintf(stderr, "Build with clang and BACNET_BUILD_FUZZ=ON for real fuzzing.\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            return 1;
        }
        std::vector<uint8_t> input((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());

        printf("Running %s (%zu bytes)\n", argv[i], input.size());
        LLVMFuzzerTestOneInput(input.data(), input.size());
    }
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
