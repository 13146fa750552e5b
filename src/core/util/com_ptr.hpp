/// @file com_ptr.hpp
/// @brief COM smart pointer for shell interfaces
///
/// IStream and IUnknown pointers handed out by a data object go through
/// WRL's ComPtr so every Release happens on scope exit.

#pragma once

#include <wrl/client.h>

namespace shelldrop {

template <typename T>
using ComPtr = Microsoft::WRL::ComPtr<T>;

}  // namespace shelldrop
