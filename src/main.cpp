/// @file main.cpp
/// @brief shelldrop demo: a window that lists whatever is dropped on it

#include <Windows.h>

#include <ShlObj.h>
#include <objbase.h>

#include <shelldrop/shelldrop.hpp>

#include "core/config/settings_manager.hpp"
#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"
#include "ui/dnd/legacy_drop.hpp"

namespace {

constexpr wchar_t kWindowClass[] = L"ShellDropDemoWindow";
constexpr int kListId = 100;

HWND g_list = nullptr;

void appendPaths(const std::vector<std::filesystem::path>& files) {
    for (const auto& file : files) {
        LOG_INFO("Dropped: {}", shelldrop::pathToUtf8(file));
        SendMessageW(g_list, LB_ADDSTRING, 0, reinterpret_cast<LPARAM>(file.c_str()));
    }
}

LRESULT CALLBACK WindowProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam) {
    switch (msg) {
    case WM_CREATE:
        g_list = CreateWindowExW(WS_EX_CLIENTEDGE, L"LISTBOX", nullptr,
                                 WS_CHILD | WS_VISIBLE | WS_VSCROLL | LBS_NOINTEGRALHEIGHT, 0, 0,
                                 0, 0, hwnd, reinterpret_cast<HMENU>(static_cast<intptr_t>(kListId)),
                                 reinterpret_cast<LPCREATESTRUCTW>(lParam)->hInstance, nullptr);
        return g_list ? 0 : -1;

    case WM_SIZE:
        MoveWindow(g_list, 0, 0, LOWORD(lParam), HIWORD(lParam), TRUE);
        return 0;

    case WM_DROPFILES:
        appendPaths(shelldrop::ui::takeDroppedFiles(reinterpret_cast<HDROP>(wParam)));
        return 0;

    case WM_DESTROY:
        shelldrop::revoke(hwnd);
        PostQuitMessage(0);
        return 0;
    }
    return DefWindowProcW(hwnd, msg, wParam, lParam);
}

}  // namespace

/// @brief Windows application entry point
int WINAPI wWinMain(_In_ HINSTANCE hInstance, _In_opt_ HINSTANCE /*hPrevInstance*/,
                    _In_ LPWSTR /*lpCmdLine*/, _In_ int nCmdShow) {
    auto settings = shelldrop::config::SettingsManager::loadOrDefault();

    // Initialize logging
    {
        std::filesystem::path log_path;
        wchar_t* local_app_data = nullptr;
        if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &local_app_data))) {
            log_path = std::filesystem::path(local_app_data) / L"shelldrop" / L"shelldrop.log";
            CoTaskMemFree(local_app_data);
        } else {
            log_path = L"shelldrop.log";
        }
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
        shelldrop::init_logging(log_path, settings.log_level, false);
        LOG_INFO("shelldrop demo {} starting...", SHELLDROP_VERSION_STRING);
    }

    shelldrop::configure(settings);

    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(wc);
    wc.lpfnWndProc = WindowProc;
    wc.hInstance = hInstance;
    wc.hCursor = LoadCursor(nullptr, IDC_ARROW);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
    wc.lpszClassName = kWindowClass;
    if (!RegisterClassExW(&wc)) {
        LOG_ERROR("RegisterClassExW failed");
        return 1;
    }

    HWND hwnd = CreateWindowExW(0, kWindowClass, L"Drop files here", WS_OVERLAPPEDWINDOW,
                                CW_USEDEFAULT, CW_USEDEFAULT, 720, 480, nullptr, nullptr,
                                hInstance, nullptr);
    if (!hwnd) {
        LOG_ERROR("CreateWindowExW failed");
        return 1;
    }

    if (!shelldrop::install(hwnd, appendPaths)) {
        LOG_WARN("OLE drop target unavailable, falling back to WM_DROPFILES");
        shelldrop::ui::enableLegacyDrop(hwnd, true, settings.legacy.allow_uipi_messages);
    }

    ShowWindow(hwnd, nCmdShow);
    UpdateWindow(hwnd);

    MSG msg;
    while (GetMessageW(&msg, nullptr, 0, 0) > 0) {
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }

    LOG_INFO("shelldrop demo shutting down");
    shelldrop::shutdown_logging();

    return static_cast<int>(msg.wParam);
}
