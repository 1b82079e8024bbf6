// main.cpp
#include "Chunker/Chunker.hpp"
#include "Joiner/Joiner.hpp"
#include "errors/errors.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace chunkstream;

namespace
{
    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " <chunk|verify> <file> [config.json]\n"
                  << "  chunk   Split the file and print every chunk checksum\n"
                  << "  verify  Split the file, join it back in memory and compare\n";
    }

    int runChunk(const std::string &path, const Settings &settings)
    {
        Chunker chunker = Chunker::fromFile(path, settings.chunk_size, settings.read_block_size);

        json summary;
        summary["file"] = path;
        summary["chunk_size"] = settings.chunk_size;
        summary["chunks"] = json::array();

        while (auto result = chunker.next())
        {
            if (auto *chunk = std::get_if<ChunkIntermediate>(&*result))
            {
                summary["chunks"].push_back(json{{"index", chunk->index},
                                                 {"size", chunk->bytes.size()},
                                                 {"checksum", chunk->checksum}});
            }
            else
            {
                const auto &last = std::get<ChunkFinal>(*result);
                summary["remainder_size"] = last.bytes.size();
                summary["file_checksum"] = last.fileChecksum;
            }
        }

        std::cout << summary.dump(4) << std::endl;
        return EXIT_SUCCESS;
    }

    int runVerify(const std::string &path, const Settings &settings)
    {
        std::ifstream input(path, std::ios::binary);
        if (!input)
        {
            MyLogger::error("Failed to open file: " + path);
            return EXIT_FAILURE;
        }
        Bytes original((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        input.close();

        std::size_t blockSize = settings.read_block_size > 0 ? settings.read_block_size : settings.chunk_size;
        Chunker chunker(std::make_unique<MemoryByteSource>(original, blockSize), settings.chunk_size);

        // The remainder of the final record becomes one more chunk
        std::vector<ChunkDescriptor> descriptors;
        std::string fileChecksum;
        while (auto result = chunker.next())
        {
            if (auto *chunk = std::get_if<ChunkIntermediate>(&*result))
            {
                Bytes bytes = std::move(chunk->bytes);
                descriptors.push_back({chunk->index, chunk->checksum,
                                       [bytes]() -> std::optional<Bytes>
                                       { return bytes; }});
            }
            else
            {
                auto &last = std::get<ChunkFinal>(*result);
                fileChecksum = last.fileChecksum;
                if (!last.bytes.empty())
                {
                    std::string checksum = sha256Hex(last.bytes);
                    Bytes bytes = std::move(last.bytes);
                    descriptors.push_back({descriptors.size(), checksum,
                                           [bytes]() -> std::optional<Bytes>
                                           { return bytes; }});
                }
            }
        }

        Joiner joiner(fileChecksum, std::move(descriptors));
        Bytes rebuilt;
        Manifest manifest;
        while (auto result = joiner.next())
        {
            if (auto *chunk = std::get_if<JoinIntermediate>(&*result))
            {
                rebuilt.insert(rebuilt.end(), chunk->bytes.begin(), chunk->bytes.end());
            }
            else
            {
                manifest = std::get<JoinFinal>(*result).sourceChunks;
            }
        }

        if (rebuilt != original)
        {
            MyLogger::error("Reassembled content differs from " + path);
            return EXIT_FAILURE;
        }

        json report;
        report["file"] = path;
        report["file_checksum"] = fileChecksum;
        report["source_chunks"] = manifest;
        std::cout << report.dump(4) << std::endl;
        MyLogger::info("Verified " + path + ": " + std::to_string(original.size()) + " bytes round-tripped");
        return EXIT_SUCCESS;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    // stdout carries only the JSON report
    MyLogger::setOutput(std::cerr);

    const std::string command = argv[1];
    const std::string path = argv[2];

    try
    {
        Settings settings;
        if (argc > 3)
        {
            settings = ConfigReader::loadSettings(argv[3]);
            if (!MyLogger::setLevel(settings.log_level))
            {
                MyLogger::warning("Ignoring unknown log level: " + settings.log_level);
            }
        }

        if (command == "chunk")
        {
            return runChunk(path, settings);
        }
        if (command == "verify")
        {
            return runVerify(path, settings);
        }

        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    catch (const ChunkError &e)
    {
        std::cerr << "Integrity check failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! Critical Error: " << e.what() << " !!!\n";
        return EXIT_FAILURE;
    }
}
