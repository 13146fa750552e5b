/// @file drop_registry_test.cpp
/// @brief Registration on real (hidden) windows

#include <gtest/gtest.h>

#include <Windows.h>

#include <Ole2.h>

#include <filesystem>
#include <vector>

#include <shelldrop/shelldrop.hpp>

#include "core/util/com_ptr.hpp"
#include "fake_data_object.hpp"
#include "log_capture.hpp"
#include "ui/dnd/drop_registry.hpp"

namespace shelldrop::test {
namespace {

void ignoreFiles(const std::vector<std::filesystem::path>&) {
}

class DropRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        hwnd_ = CreateWindowExW(0, L"STATIC", L"shelldrop test", WS_OVERLAPPED, 0, 0, 10, 10,
                                nullptr, nullptr, GetModuleHandleW(nullptr), nullptr);
        ASSERT_NE(hwnd_, nullptr);
    }

    void TearDown() override {
        ui::DropRegistry::instance().revokeAll();
        if (hwnd_) {
            DestroyWindow(hwnd_);
        }
    }

    HWND hwnd_ = nullptr;
};

TEST_F(DropRegistryTest, InstallThenRevoke) {
    ASSERT_TRUE(install(hwnd_, ignoreFiles));
    EXPECT_TRUE(isInstalled(hwnd_));
    EXPECT_EQ(ui::DropRegistry::instance().registrationCount(), 1u);

    revoke(hwnd_);
    EXPECT_FALSE(isInstalled(hwnd_));
    EXPECT_EQ(ui::DropRegistry::instance().registrationCount(), 0u);
    EXPECT_EQ(RevokeDragDrop(hwnd_), DRAGDROP_E_NOTREGISTERED);
}

TEST_F(DropRegistryTest, RevokeIsIdempotent) {
    revoke(hwnd_);
    EXPECT_FALSE(isInstalled(hwnd_));

    ASSERT_TRUE(install(hwnd_, ignoreFiles));
    revoke(hwnd_);
    revoke(hwnd_);
    EXPECT_FALSE(isInstalled(hwnd_));
}

TEST_F(DropRegistryTest, ReinstallReplacesTarget) {
    auto first = ui::DropRegistry::instance().install(hwnd_, ignoreFiles);
    ASSERT_TRUE(first.has_value());
    auto second = ui::DropRegistry::instance().install(hwnd_, ignoreFiles);
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(ui::DropRegistry::instance().registrationCount(), 1u);
    EXPECT_EQ((*second)->hwnd(), hwnd_);
}

TEST_F(DropRegistryTest, RegisteredTargetHoldsShellReference) {
    auto target = ui::DropRegistry::instance().install(hwnd_, ignoreFiles);
    ASSERT_TRUE(target.has_value());

    // RegisterDragDrop keeps its own reference on top of the initial one
    EXPECT_GE((*target)->refCount(), 2);
}

TEST_F(DropRegistryTest, RevokeFromInsideDropKeepsTargetAlive) {
    auto& registry = ui::DropRegistry::instance();
    int calls = 0;
    HWND hwnd = hwnd_;

    auto installed =
        registry.install(hwnd_, [&calls, hwnd](const std::vector<std::filesystem::path>&) {
            ++calls;
            revoke(hwnd);
        });
    ASSERT_TRUE(installed.has_value());
    ui::DropTarget* target = *installed;

    // The reference a drag loop holds for the length of the drag
    target->AddRef();

    ComPtr<FakeDataObject> data;
    data.Attach(new FakeDataObject());
    data->setFileList({L"C:\\dropped.txt"});

    DWORD effect = DROPEFFECT_NONE;
    POINTL pt = {1, 1};
    ASSERT_EQ(target->DragEnter(data.Get(), MK_LBUTTON, pt, &effect), S_OK);
    ASSERT_EQ(target->Drop(data.Get(), 0, pt, &effect), S_OK);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(effect, static_cast<DWORD>(DROPEFFECT_COPY));
    EXPECT_FALSE(isInstalled(hwnd_));
    EXPECT_EQ(registry.retiredCount(), 1u);

    // Still a live object: the shell's last Release lands on valid memory
    EXPECT_EQ(target->Release(), 1u);
    EXPECT_EQ(target->refCount(), 1);
    EXPECT_EQ(target->hwnd(), hwnd_);

    // Freed by the next registry call once nothing holds it
    revoke(hwnd_);
    EXPECT_EQ(registry.retiredCount(), 0u);
}

TEST_F(DropRegistryTest, ReinstallRetiresTargetStillReferenced) {
    auto& registry = ui::DropRegistry::instance();
    auto first = registry.install(hwnd_, ignoreFiles);
    ASSERT_TRUE(first.has_value());
    (*first)->AddRef();

    auto second = registry.install(hwnd_, ignoreFiles);
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
    EXPECT_EQ(registry.retiredCount(), 1u);

    EXPECT_EQ((*first)->Release(), 1u);
    registry.revokeAll();
    EXPECT_EQ(registry.retiredCount(), 0u);
}

TEST_F(DropRegistryTest, UnreferencedTargetIsNotRetired) {
    ASSERT_TRUE(install(hwnd_, ignoreFiles));
    revoke(hwnd_);
    EXPECT_EQ(ui::DropRegistry::instance().retiredCount(), 0u);
}

TEST_F(DropRegistryTest, FailedInstallLogsOneRecord) {
    LogCapture log;

    auto result = ui::DropRegistry::instance().install(nullptr, ignoreFiles);
    ASSERT_FALSE(result.has_value());

    EXPECT_EQ(log.count("failed"), 1) << log.text();
    EXPECT_EQ(log.count("[error]"), 0) << log.text();
}

TEST_F(DropRegistryTest, InvalidWindowRejected) {
    auto null_result = ui::DropRegistry::instance().install(nullptr, ignoreFiles);
    ASSERT_FALSE(null_result.has_value());
    EXPECT_EQ(null_result.error(), DropError::RegistrationFailure);

    HWND destroyed = CreateWindowExW(0, L"STATIC", L"", 0, 0, 0, 1, 1, nullptr, nullptr,
                                     GetModuleHandleW(nullptr), nullptr);
    ASSERT_NE(destroyed, nullptr);
    DestroyWindow(destroyed);
    EXPECT_FALSE(install(destroyed, ignoreFiles));
    EXPECT_EQ(ui::DropRegistry::instance().registrationCount(), 0u);
}

TEST_F(DropRegistryTest, EmptyHandlerRejected) {
    auto result = ui::DropRegistry::instance().install(hwnd_, FileListHandler{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), DropError::RegistrationFailure);
    EXPECT_FALSE(isInstalled(hwnd_));
}

TEST_F(DropRegistryTest, MultipleWindows) {
    HWND other = CreateWindowExW(0, L"STATIC", L"other", WS_OVERLAPPED, 0, 0, 10, 10, nullptr,
                                 nullptr, GetModuleHandleW(nullptr), nullptr);
    ASSERT_NE(other, nullptr);

    ASSERT_TRUE(install(hwnd_, ignoreFiles));
    ASSERT_TRUE(install(other, ignoreFiles));
    EXPECT_EQ(ui::DropRegistry::instance().registrationCount(), 2u);

    revoke(hwnd_);
    EXPECT_FALSE(isInstalled(hwnd_));
    EXPECT_TRUE(isInstalled(other));

    revoke(other);
    DestroyWindow(other);
}

TEST_F(DropRegistryTest, ConfigureAppliesToLaterInstalls) {
    auto settings = config::DropSettings::defaults();
    settings.spool.prefix = "configured";
    configure(settings);

    EXPECT_EQ(ui::DropRegistry::instance().settings().spool.prefix, "configured");

    configure(config::DropSettings::defaults());
}

}  // namespace
}  // namespace shelldrop::test
