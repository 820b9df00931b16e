#include "lib/dflash_analyzer.hpp"
#include "lib/dump_loader.hpp"
#include "lib/eeprom_checksum.hpp"
#include "lib/errors.hpp"
#include "lib/frm_converter.hpp"
#include "lib/frm_layout.hpp"
#include "lib/report_printer.hpp"
#include "utils/logs.hpp"
#include "utils/colors.hpp"
#include "misc/version.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <getopt.h>

struct Options {
    std::string inputPath;
    std::string outputPath;
    std::string verifyPath;
    bool analyzeOnly = false;
    bool dryRun = false;
    bool forceOperation = false;
    bool showHexDump = false;
    bool verbose = false;
};

void printUsage() {
    std::cout << Colors::bold("Usage:") << " frmrestore [OPTIONS]\n\n";
    std::cout << Colors::cyan("Options:") << "\n";
    std::cout << "  -i <file>          Input D-Flash dump (.bin, .hex or .eep)\n";
    std::cout << "  -o <file>          Output EEPROM image\n";
    std::cout << "  -a                 Analyze only, do not convert\n";
    std::cout << "  --dry-run          Convert in memory without writing the output\n";
    std::cout << "  --force            Convert even when the dump looks unrecoverable\n";
    std::cout << "  --verify <file>    Check the checksum of an existing EEPROM image\n";
    std::cout << "  --hexdump          Dump the written EEPROM regions\n";
    std::cout << "  --verbose          Show debug output\n";
    std::cout << "  --no-color         Disable colored output\n";
    std::cout << "  -v                 Show version information\n";
    std::cout << "  -h                 Show this help message\n\n";

    std::cout << Colors::bold("Examples:") << "\n";
    std::cout << "  frmrestore -i frm_dflash.bin -a\n";
    std::cout << "  frmrestore -i frm_dflash.bin -o frm_eeprom.eep\n";
    std::cout << "  frmrestore -i frm_dflash.hex --dry-run --hexdump\n";
    std::cout << "  frmrestore --verify frm_eeprom.eep\n\n";

    std::cout << Colors::yellow("Note: ") << "Input must be a full 32 KB D-Flash dump; output is a 4 KB EEPROM image\n";
}

bool parseArguments(int argc, char* argv[], Options& opts) {
    int opt;

    static struct option long_options[] = {
        {"dry-run", no_argument, 0, 'd'},
        {"force", no_argument, 0, 'F'},
        {"verify", required_argument, 0, 'V'},
        {"hexdump", no_argument, 0, 'x'},
        {"verbose", no_argument, 0, 'D'},
        {"no-color", no_argument, 0, 'N'},
        {0, 0, 0, 0}
    };

    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "i:o:avh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                opts.inputPath = optarg;
                break;
            case 'o':
                opts.outputPath = optarg;
                break;
            case 'a':
                opts.analyzeOnly = true;
                break;
            case 'd':
                opts.dryRun = true;
                break;
            case 'F':
                opts.forceOperation = true;
                break;
            case 'V':
                opts.verifyPath = optarg;
                break;
            case 'x':
                opts.showHexDump = true;
                break;
            case 'D':
                opts.verbose = true;
                break;
            case 'N':
                Colors::setEnabled(false);
                break;
            case 'v':
                Version::printVersion();
                exit(0);
            case 'h':
                printUsage();
                exit(0);
            default:
                printUsage();
                return false;
        }
    }

    if (!opts.verifyPath.empty()) {
        return true;
    }

    if (opts.inputPath.empty()) {
        Logs::error("-i (input D-Flash dump) is required");
        printUsage();
        return false;
    }

    if (!opts.analyzeOnly && !opts.dryRun && opts.outputPath.empty()) {
        Logs::error("-o (output EEPROM image) is required unless -a or --dry-run is given");
        return false;
    }

    return true;
}

int verifyImage(const std::string& path) {
    Logs::info("Verifying EEPROM image: " + path);

    std::vector<uint8_t> image = DumpLoader::readFile(path);
    if (image.size() != FrmLayout::EEPROM_SIZE) {
        Logs::warning("Unexpected EEPROM size: " + DumpLoader::formatFileSize(image.size()) +
                      " (expected " + std::to_string(FrmLayout::EEPROM_SIZE) + " bytes)");
    }

    std::ostringstream sums;
    sums << std::hex << std::uppercase << "stored 0x" << EepromChecksum::stored(image)
         << ", computed 0x" << EepromChecksum::compute(image);

    if (!EepromChecksum::verify(image)) {
        Logs::error("Checksum mismatch: " + sums.str());
        return 1;
    }

    Logs::success("Checksum valid: " + sums.str());
    return 0;
}

void showHexDump(const std::vector<uint8_t>& eeprom) {
    std::cout << Colors::bold("Header / VIN / mileage:") << "\n";
    std::cout << ReportPrinter::hexDump(eeprom, FrmLayout::EEPROM_HEADER_OFFSET, 0x40);
    std::cout << Colors::bold("Configuration block:") << "\n";
    std::cout << ReportPrinter::hexDump(eeprom, FrmLayout::EEPROM_CONFIG_OFFSET, 0x10);
    std::cout << Colors::bold("Checksum:") << "\n";
    std::cout << ReportPrinter::hexDump(eeprom, FrmLayout::EEPROM_SIZE - 0x10, 0x10) << std::endl;
}

int main(int argc, char* argv[]) {
    Options opts;

    try {
        Version::printBanner();

        if (argc < 2) {
            printUsage();
            return 1;
        }

        if (!parseArguments(argc, argv, opts)) {
            return 1;
        }

        Logs::setVerbose(opts.verbose);

        if (!opts.verifyPath.empty()) {
            return verifyImage(opts.verifyPath);
        }

        Logs::info("D-Flash dump: " + opts.inputPath);

        std::vector<uint8_t> dflash = DumpLoader::loadDump(opts.inputPath);
        Logs::info("Dump size: " + DumpLoader::formatFileSize(dflash.size()));

        DFlashAnalyzer::AnalysisReport report = DFlashAnalyzer::analyze(dflash);
        ReportPrinter::printAnalysis(std::cout, report);

        if (opts.analyzeOnly) {
            return 0;
        }

        if (!report.repairable) {
            if (!opts.forceOperation) {
                Logs::error("Dump is not recoverable enough for conversion (use --force to override)");
                return 1;
            }
            Logs::warning("Proceeding with --force flag");
        }

        FrmConverter::ConversionResult result = FrmConverter::convert(dflash);
        ReportPrinter::printConversion(std::cout, result);

        if (!result.success) {
            Logs::error(result.message);
            return 1;
        }

        if (opts.showHexDump) {
            showHexDump(result.eepromData);
        }

        if (opts.dryRun) {
            Logs::info("Dry run: EEPROM image not written");
            return 0;
        }

        DumpLoader::saveImage(opts.outputPath, result.eepromData);

        std::cout << "\n" << Colors::green(Colors::bold("✓ SUCCESS!")) << std::endl;
        Logs::success("EEPROM image written to " + opts.outputPath);
        Logs::info("Verify before programming with: frmrestore --verify " + opts.outputPath);

        return 0;

    } catch (const SizeMismatchError& e) {
        Logs::fatal(e.what());
        return 1;
    } catch (const FileError& e) {
        Logs::fatal(e.what());
        return 1;
    } catch (const FormatError& e) {
        std::string file = opts.inputPath.empty() ? opts.verifyPath : opts.inputPath;
        ErrorHandler::handleFatalError(file, e.what());
        return 1;
    } catch (const std::exception& e) {
        Logs::fatal("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
