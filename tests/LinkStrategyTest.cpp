#include <cassert>
#include <filesystem>
#include <iostream>

#include "CrossSaveErrors.hpp"
#include "LinkStrategy.hpp"
#include "TestHelpers.hpp"

namespace FS = std::filesystem;

int main()
{
    std::cout << "[Test] Starting LinkStrategy Test..." << std::endl;

    FS::path Root = MakeTestRoot("link_strategy");
    auto Strategy = CreateLinkStrategy();
    std::cout << "[Test] Platform " << GetPlatformName() << ", link type " << Strategy->Name() << std::endl;

#ifdef _WIN32
    assert(Strategy->Name() == "Junction");
#else
    assert(Strategy->Name() == "Symlink");
#endif

    FS::path Target = Root / "Cloud" / "Saves";
    FS::path LinkPath = Root / "Game" / "Saves";
    WriteFile(Target / "Farm_1", "farm");
    FS::create_directories(LinkPath.parent_path());

    // Missing paths are simply not links
    assert(!Strategy->IsLink(LinkPath));
    assert(Strategy->LinkTarget(LinkPath).empty());

    // A real folder is not a link and RemoveLink leaves it alone
    FS::create_directories(Root / "RealFolder");
    WriteFile(Root / "RealFolder" / "data", "real");
    assert(!Strategy->IsLink(Root / "RealFolder"));
    Strategy->RemoveLink(Root / "RealFolder");
    assert(ReadFile(Root / "RealFolder" / "data") == "real");

    std::cout << "[Test] Create link..." << std::endl;
    Strategy->CreateLink(LinkPath, Target);
    assert(Strategy->IsLink(LinkPath));
    assert(FS::is_directory(LinkPath));
    assert(ReadFile(LinkPath / "Farm_1") == "farm" && "The link resolves to the cloud folder");
    assert(FS::equivalent(LinkPath, Target));
    assert(FS::equivalent(Strategy->LinkTarget(LinkPath), Target));

    std::cout << "[Test] Create link over an existing entry..." << std::endl;
    bool Threw = false;
    try
    {
        Strategy->CreateLink(Root / "RealFolder", Target);
    }
    catch (const LinkCreationError& e)
    {
        Threw = true;
        assert(e.GetKind() == ErrorKind::LinkCreation);
        assert(std::string(e.what()).find("RealFolder") != std::string::npos);
    }
    assert(Threw);

    std::cout << "[Test] Remove link..." << std::endl;
    Strategy->RemoveLink(LinkPath);
    assert(!FS::exists(FS::symlink_status(LinkPath)));
    assert(!Strategy->IsLink(LinkPath));
    assert(ReadFile(Target / "Farm_1") == "farm" && "Removing the link keeps the cloud data");

    // Removing again is a no-op
    Strategy->RemoveLink(LinkPath);

    FS::remove_all(Root);
    std::cout << "[PASS] LinkStrategy Test." << std::endl;
    return 0;
}
