#include <atomic>
#include <chrono>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include "../src/TextFileRegistry.hpp"
#include "../src/TextFrameErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        auto tmpDir = std::filesystem::temp_directory_path() / "textframe_registry_test";
        std::filesystem::remove_all(tmpDir);
        std::filesystem::create_directories(tmpDir / "allowed");
        auto textPath = tmpDir / "allowed" / "text.txt";
        auto outsidePath = tmpDir / "outside.txt";

        std::string content;
        for (int i = 0; i < 2000; ++i) {
            content += "\xC2\xB6 paragraph " + std::to_string(i) + "\n";  // ¶
        }
        {
            std::ofstream ofs(textPath, std::ios::binary);
            ofs << content;
            std::ofstream ofs2(outsidePath, std::ios::binary);
            ofs2 << "outside\n";
        }

        TextFileRegistry registry;
        auto text = registry.open(textPath.string());
        ASSERT_TRUE(text != nullptr);
        std::string handler = std::filesystem::canonical(textPath).string();
        ASSERT_TRUE(registry.getByHandler(handler) == text);
        ASSERT_TRUE(text->lineCount().has_value());
        ASSERT_TRUE(*text->lineCount() == 2000);
        ASSERT_TRUE(text->byteLength() == content.size());
        ASSERT_TRUE(text->length() == content.size() - 2000);
        std::cout << "Open success, characters: " << text->length() << std::endl;

        // opening again shares the same text and bumps the reference count
        auto again = registry.open(textPath.string());
        ASSERT_TRUE(again == text);
        ASSERT_TRUE(text->refCount() == 2);

        // reads from many threads agree with a single-threaded read
        std::string expectedLines = text->readLines(100, 110);
        std::string expectedTail = text->readChars(-50, 0);
        std::vector<std::thread> workers;
        std::vector<int> failures(8, 0);
        for (int t = 0; t < 8; ++t) {
            workers.emplace_back([&, t] {
                for (int i = 0; i < 200; ++i) {
                    int64_t line = (t * 200 + i) % 1990;
                    std::string got = text->readLines(line, line + 10);
                    std::string want = "\xC2\xB6 paragraph " + std::to_string(line) + "\n";
                    if (got.rfind(want, 0) != 0) failures[t]++;
                    if (text->readLines(100, 110) != expectedLines) failures[t]++;
                    if (text->readChars(-50, 0) != expectedTail) failures[t]++;
                }
            });
        }
        for (auto& w : workers) w.join();
        for (int f : failures) ASSERT_TRUE(f == 0);

        // byte reads go through the same shared/exclusive path
        ASSERT_TRUE(text->readBytes(0, 2) == "\xC2\xB6");
        bool threw = false;
        try {
            text->readBytes(1, 2);
        } catch (const MisalignedByteOffsetError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // first close only drops a reference
        registry.close(handler);
        ASSERT_TRUE(registry.getByHandler(handler) != nullptr);
        registry.close(handler);
        ASSERT_TRUE(registry.getByHandler(handler) == nullptr);
        ASSERT_TRUE(registry.listHandlers().empty());
        // outstanding holders keep working after close
        ASSERT_TRUE(text->readChars(0, 1) == "\xC2\xB6");
        std::cout << "Close success" << std::endl;

        // handlers are listed sorted
        registry.open(outsidePath.string());
        registry.open(textPath.string());
        auto handlers = registry.listHandlers();
        ASSERT_TRUE(handlers.size() == 2);
        ASSERT_TRUE(handlers[0] < handlers[1]);

        // allow-list
        TextFileRegistry restricted;
        restricted.setAllowedPaths({(tmpDir / "allowed").string()});
        ASSERT_TRUE(restricted.isPathAllowed(textPath.string()));
        ASSERT_TRUE(!restricted.isPathAllowed(outsidePath.string()));
        threw = false;
        try {
            restricted.open(outsidePath.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // options: cache directory and line mode
        TextFileRegistry cached;
        RegistryOptions options;
        options.cacheDir = (tmpDir / "cache").string();
        options.mode = TextFileMode::NoLineIndex;
        options.checkpointInterval = 128;
        cached.setOptions(options);
        std::string sideCar = cached.cachePathFor(handler);
        ASSERT_TRUE(sideCar.find((tmpDir / "cache").string()) == 0);
        ASSERT_TRUE(sideCar.size() > 6 && sideCar.substr(sideCar.size() - 6) == ".tfidx");
        ASSERT_TRUE(sideCar == cached.cachePathFor(handler));
        ASSERT_TRUE(sideCar != cached.cachePathFor(handler + "x"));

        auto plain = cached.open(textPath.string());
        ASSERT_TRUE(!plain->lineCount().has_value());
        ASSERT_TRUE(!plain->indexLoadedFromCache());
        ASSERT_TRUE(std::filesystem::exists(sideCar));
        threw = false;
        try {
            plain->readLines(0, 1);
        } catch (const LineIndexDisabledError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        cached.close(handler);

        // reopening picks the side-car up
        auto reopened = cached.open(textPath.string());
        ASSERT_TRUE(reopened->indexLoadedFromCache());
        ASSERT_TRUE(reopened->checksumHex() == plain->checksumHex());
        ASSERT_TRUE(reopened->frameCount() == 0);

        // indexing a large text does not hold up readers of texts already open
        auto largePath = tmpDir / "allowed" / "large.txt";
        {
            std::ofstream ofs(largePath, std::ios::binary);
            std::string block;
            for (int i = 0; i < 4096; ++i) block += "\xE7\xAC\xAC line of a large corpus\n";  // 第
            for (int i = 0; i < 200; ++i) ofs << block;
        }
        TextFileRegistry busy;
        auto small = busy.open(textPath.string());
        std::atomic<bool> largeDone(false);
        std::shared_ptr<SharedTextFile> large;
        std::thread opener([&] {
            large = busy.open(largePath.string());
            largeDone = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto started = std::chrono::steady_clock::now();
        auto found = busy.getByHandler(handler);
        std::string firstLine = found ? found->readLines(0, 1) : std::string();
        auto handlersWhileIndexing = busy.listHandlers();
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        bool stillIndexing = !largeDone;
        opener.join();
        ASSERT_TRUE(found == small);
        ASSERT_TRUE(firstLine == "\xC2\xB6 paragraph 0\n");
        ASSERT_TRUE(!handlersWhileIndexing.empty());
        if (stillIndexing) {
            ASSERT_TRUE(waited < 50);
        }
        std::cout << "Read during indexing took " << waited << " ms" << std::endl;
        ASSERT_TRUE(large != nullptr);
        ASSERT_TRUE(*large->lineCount() == 4096 * 200);
        ASSERT_TRUE(busy.listHandlers().size() == 2);

        // racing opens of one path end up sharing a single text
        TextFileRegistry racing;
        std::shared_ptr<SharedTextFile> first;
        std::shared_ptr<SharedTextFile> second;
        std::thread a([&] { first = racing.open(textPath.string()); });
        std::thread b([&] { second = racing.open(textPath.string()); });
        a.join();
        b.join();
        ASSERT_TRUE(first == second);
        ASSERT_TRUE(first->refCount() == 2);
        ASSERT_TRUE(racing.listHandlers().size() == 1);

        // options and allow-list can be swapped while lookups run
        RegistryOptions initial;
        initial.cacheDir = (tmpDir / "cache0").string();
        racing.setOptions(initial);
        std::atomic<bool> stop(false);
        std::thread reconfigure([&] {
            for (int i = 0; i < 200; ++i) {
                RegistryOptions swapped;
                swapped.cacheDir = (tmpDir / ("cache" + std::to_string(i % 2))).string();
                racing.setOptions(swapped);
                racing.setAllowedPaths({(tmpDir / "allowed").string()});
            }
            stop = true;
        });
        int lookups = 0;
        bool consistent = true;
        while (!stop) {
            std::string path = racing.cachePathFor(handler);
            if (path.empty() || !racing.isPathAllowed(textPath.string())) consistent = false;
            ++lookups;
        }
        reconfigure.join();
        ASSERT_TRUE(consistent);
        std::cout << "Concurrent lookups: " << lookups << std::endl;

        std::filesystem::remove_all(tmpDir);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Registry tests passed" << std::endl;
    return 0;
}
