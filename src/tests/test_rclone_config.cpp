#include "rclone_config.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <sstream>

using namespace driveup;

namespace fs = std::filesystem;

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void test_rendering() {
    std::cout << "Testing rclone config generation...\n\n";

    // Test 1: Shared drive ids bind team_drive
    {
        auto text = render_rclone_config(Credential{"/keys/sa-1.json"}, "0ABCdefGHI");
        assert(text.find("[gdrive]\n") == 0);
        assert(text.find("type = drive\n") != std::string::npos);
        assert(text.find("scope = drive\n") != std::string::npos);
        assert(text.find("service_account_file = /keys/sa-1.json\n") != std::string::npos);
        assert(text.find("team_drive = 0ABCdefGHI\n") != std::string::npos);
        assert(text.find("root_folder_id") == std::string::npos);
        std::cout << "✓ Test 1 passed: Shared drive target\n";
    }

    // Test 2: Anything else is a folder id
    {
        auto text = render_rclone_config(Credential{"/keys/sa-1.json"}, "1xYzFolderId");
        assert(text.find("root_folder_id = 1xYzFolderId\n") != std::string::npos);
        assert(text.find("team_drive") == std::string::npos);
        assert(!is_team_drive("1xYzFolderId"));
        assert(is_team_drive("0A"));
        std::cout << "✓ Test 2 passed: Folder target\n";
    }

    // Test 3: SHA-256 known answer
    {
        assert(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(sha256_hex("").size() == 64);
        std::cout << "✓ Test 3 passed: SHA-256 digest\n";
    }
}

void test_store() {
    // Test 4: Temp workspace exists while alive and is removed with its contents
    fs::path workspace_path;
    {
        auto workspace = TempWorkspace::create("driveup-test");
        assert(workspace.has_value());
        workspace_path = workspace->path();
        assert(fs::is_directory(workspace_path));

        // Test 5: One file per credential, reused on later calls
        RcloneConfigStore store(workspace->path(), "0ATeamDrive");
        Credential a{"/keys/a/sa.json"};
        Credential b{"/keys/b/sa.json"};

        auto first = store.config_for(a);
        auto again = store.config_for(a);
        auto other = store.config_for(b);
        assert(first.has_value() && again.has_value() && other.has_value());
        assert(*first == *again);
        assert(*first != *other);
        assert(first->parent_path() == workspace->path());
        assert(first->filename().string().starts_with("rclone_sa_"));
        assert(first->extension() == ".conf");
        assert(read_file(*first) == render_rclone_config(a, "0ATeamDrive"));
        assert(read_file(*other).find("service_account_file = /keys/b/sa.json") != std::string::npos);

        size_t files = 0;
        for (const auto& entry : fs::directory_iterator(workspace->path())) {
            (void)entry;
            ++files;
        }
        assert(files == 2);
        std::cout << "✓ Test 5 passed: One config per credential\n";

        // Moving transfers ownership; the moved-from object removes nothing
        TempWorkspace moved = std::move(*workspace);
        assert(moved.path() == workspace_path);
        assert(fs::is_directory(workspace_path));
    }
    assert(!fs::exists(workspace_path));
    std::cout << "✓ Test 4 passed: Workspace cleaned up on destruction\n";

    // Test 6: Unwritable directory is an item-level failure
    {
        RcloneConfigStore store("/nonexistent/driveup/configs", "folder");
        auto config = store.config_for(Credential{"/keys/sa.json"});
        assert(!config.has_value());
        assert(config.error().error == UploadError::ItemTransferFailed);
        std::cout << "✓ Test 6 passed: Write failure reported\n";
    }
}

int main() {
    try {
        test_rendering();
        test_store();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
