/**
 * @file files.cpp
 * @brief Example: Browsing and pruning the daemon's file store
 */

#include <mmbind_client/connection.hpp>
#include <mmbind_client/file_store.hpp>

#include <iostream>
#include <string>

namespace {

void printTree(const mmbind::client::FileStore& store, int depth) {
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');
    for (const auto& name : store.names()) {
        if (store.isDirectory(name)) {
            std::cout << indent << name << "/\n";
            printTree(store.directory(name), depth + 1);
        } else {
            std::cout << indent << name << "  (" << store.fileSize(name) << " bytes)\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string path = argc > 1 ? argv[1] : "/tmp/minimega/minimega";
    const std::string victim = argc > 2 ? argv[2] : "";

    try {
        mmbind::client::Connection conn(path);
        mmbind::client::FileStore files(conn);

        std::cout << files.cwd() << "\n";
        printTree(files, 1);

        if (!victim.empty()) {
            files.remove(victim);
            std::cout << "Deleted " << victim << ", " << files.size() << " entries left\n";
        }

        std::cout << "Transfers: " << files.status().responseText() << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
