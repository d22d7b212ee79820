#include "cli/Commands.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/BlobStorageAdapter.hpp"
#include "storage/blob/LocalDiskBlobClient.hpp"

#include <fstream>
#include <memory>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace bfs;

namespace {

void printJson(std::ostream& out, const nlohmann::json& j) { out << j.dump(2) << '\n'; }

int dispatch(const storage::BlobStorageAdapter& fs, const std::string& cmd, const std::vector<std::string>& args,
             std::ostream& out, std::ostream& err) {
    const auto need = [&](const size_t n) {
        if (args.size() != n) throw std::invalid_argument(fmt::format("'{}' expects {} argument(s)", cmd, n));
    };

    if (cmd == "ls") {
        std::string dir;
        bool recursive = false;
        for (const auto& a : args) {
            if (a == "-r") recursive = true;
            else if (dir.empty()) dir = a;
            else throw std::invalid_argument("'ls' takes at most one directory");
        }
        printJson(out, fs.listContents(dir, recursive));
        return cli::EXIT_OK;
    }

    if (cmd == "cat") {
        need(1);
        const auto m = fs.readStream(args[0]);
        if (m.size.value_or(0) > 0) out << m.stream->rdbuf();
        return cli::EXIT_OK;
    }

    if (cmd == "put") {
        if (args.size() != 2 && args.size() != 4)
            throw std::invalid_argument("'put' expects <path> <file> [--content-type T]");

        types::WriteOptions options;
        if (args.size() == 4) {
            if (args[2] != "--content-type") throw std::invalid_argument("Unknown option: " + args[2]);
            options.content_type = args[3];
        }

        const auto in = std::make_shared<std::ifstream>(args[1], std::ios::binary);
        if (!*in) throw std::invalid_argument("Cannot open local file: " + args[1]);
        printJson(out, fs.writeStream(args[0], in, options));
        return cli::EXIT_OK;
    }

    if (cmd == "stat") {
        need(1);
        printJson(out, fs.getMetadata(args[0]));
        return cli::EXIT_OK;
    }

    if (cmd == "exists") {
        need(1);
        return fs.has(args[0]) ? cli::EXIT_OK : cli::EXIT_ERROR;
    }

    if (cmd == "rm") { need(1); fs.deleteFile(args[0]); return cli::EXIT_OK; }
    if (cmd == "rmdir") { need(1); fs.deleteDir(args[0]); return cli::EXIT_OK; }
    if (cmd == "mkdir") { need(1); printJson(out, fs.createDir(args[0])); return cli::EXIT_OK; }
    if (cmd == "cp") { need(2); fs.copy(args[0], args[1]); return cli::EXIT_OK; }
    if (cmd == "mv") { need(2); fs.rename(args[0], args[1]); return cli::EXIT_OK; }

    err << fmt::format("blobfs: unknown command '{}'\n", cmd);
    return cli::usage(err);
}

}

int cli::usage(std::ostream& err) {
    err << "usage: blobfs [-c config.yaml] <command> [args...]\n"
           "  ls [dir] [-r]              list directory contents\n"
           "  cat <path>                 print a blob\n"
           "  put <path> <file> [--content-type T]\n"
           "  stat <path>                show normalized metadata\n"
           "  exists <path>              exit 0 if the blob exists, 1 otherwise\n"
           "  rm <path> | rmdir <dir> | mkdir <dir>\n"
           "  cp <from> <to> | mv <from> <to>\n"
           "  config                     print the effective configuration\n";
    return EXIT_USAGE;
}

int cli::execute(const config::Config& cfg, const std::vector<std::string>& args, std::ostream& out,
                 std::ostream& err) {
    if (args.empty()) return usage(err);

    const auto& cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (cmd == "config") {
            if (!rest.empty()) throw std::invalid_argument("'config' takes no arguments");
            printJson(out, cfg);
            return EXIT_OK;
        }

        const storage::BlobStorageAdapter fs(
            std::make_shared<storage::blob::LocalDiskBlobClient>(cfg.storage.root),
            cfg.storage.container, cfg.storage.path_prefix, cfg.listing);

        logging::LogRegistry::blobfs()->debug("[blobfs] Running '{}'", cmd);
        return dispatch(fs, cmd, rest, out, err);
    } catch (const storage::blob::ServiceError& e) {
        err << fmt::format("blobfs: service error {}: {}\n", e.code(), e.what());
        return EXIT_ERROR;
    } catch (const std::invalid_argument& e) {
        err << fmt::format("blobfs: {}\n", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        err << fmt::format("blobfs: {}\n", e.what());
        return EXIT_ERROR;
    }
}
