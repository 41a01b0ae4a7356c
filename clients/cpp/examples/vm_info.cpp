/**
 * @file vm_info.cpp
 * @brief Example: Querying VMs across the mesh with the mmbind client
 */

#include <mmbind_client/connection.hpp>

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    const std::string path = argc > 1 ? argv[1] : "/tmp/minimega/minimega";

    try {
        // Connect to daemon
        mmbind::client::Connection conn(path);
        std::cout << "Connected to " << path << "\n";

        // Every mesh host answers with its own frame
        conn.stream("mesh send", {"all", "vm", "info"});
        for (const auto& frame : conn.drainStream()) {
            if (frame.hasError()) {
                std::cerr << frame.host << ": " << frame.error << "\n";
                continue;
            }

            std::cout << "== " << frame.host << " ==\n";
            for (const auto& column : frame.header) {
                std::cout << column << "\t";
            }
            std::cout << "\n";
            for (const auto& row : frame.tabular) {
                for (const auto& cell : row) {
                    std::cout << cell << "\t";
                }
                std::cout << "\n";
            }
        }

        // Local host only
        auto local = conn.send("vm info", {"summary"});
        std::cout << "Local summary: " << local.tabular.size() << " VMs\n";

        conn.close();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
