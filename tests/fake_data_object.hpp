/// @file fake_data_object.hpp
/// @brief In-process IDataObject that plays the part of a drag source

#pragma once

#include <Windows.h>

#include <ObjIdl.h>
#include <ShlObj.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/dnd/drop_payload.hpp"

namespace shelldrop::test {

/// @brief How FileContents for one virtual file is delivered
enum class ContentDelivery {
    Stream,   // TYMED_ISTREAM
    HGlobal,  // TYMED_HGLOBAL
    Fail,     // GetData returns E_FAIL
};

/// @brief Fake drag source data object
///
/// Offers CF_HDROP when a file list is set and FileGroupDescriptorW +
/// FileContents when virtual files are added. HGLOBAL media are handed out
/// with a pUnkForRelease tracker so tests can check that every medium came
/// back.
class FakeDataObject : public IDataObject {
public:
    FakeDataObject();
    virtual ~FakeDataObject();

    void setFileList(const std::vector<std::filesystem::path>& paths);
    void addVirtualFile(const std::u16string& name, std::vector<std::byte> contents,
                        ContentDelivery delivery = ContentDelivery::Stream);
    void addVirtualDirectory(const std::u16string& name);

    /// @brief HGLOBAL media handed out and not yet released
    [[nodiscard]] LONG outstandingMedia() const noexcept { return outstanding_; }

    /// @brief FileContents requests seen, by index
    [[nodiscard]] const std::vector<LONG>& contentRequests() const noexcept {
        return content_requests_;
    }

    // IUnknown
    STDMETHOD(QueryInterface)(REFIID riid, void** ppv) override;
    STDMETHOD_(ULONG, AddRef)() override;
    STDMETHOD_(ULONG, Release)() override;

    // IDataObject
    STDMETHOD(GetData)(FORMATETC* pformatetcIn, STGMEDIUM* pmedium) override;
    STDMETHOD(GetDataHere)(FORMATETC* pformatetc, STGMEDIUM* pmedium) override;
    STDMETHOD(QueryGetData)(FORMATETC* pformatetc) override;
    STDMETHOD(GetCanonicalFormatEtc)(FORMATETC* pformatectIn, FORMATETC* pformatetcOut) override;
    STDMETHOD(SetData)(FORMATETC* pformatetc, STGMEDIUM* pmedium, BOOL fRelease) override;
    STDMETHOD(EnumFormatEtc)(DWORD dwDirection, IEnumFORMATETC** ppenumFormatEtc) override;
    STDMETHOD(DAdvise)(FORMATETC* pformatetc, DWORD advf, IAdviseSink* pAdvSink,
                       DWORD* pdwConnection) override;
    STDMETHOD(DUnadvise)(DWORD dwConnection) override;
    STDMETHOD(EnumDAdvise)(IEnumSTATDATA** ppenumAdvise) override;

private:
    struct VirtualFile {
        dnd::VirtualFileRecord record;
        std::vector<std::byte> contents;
        ContentDelivery delivery = ContentDelivery::Stream;
    };

    HRESULT handOutBlock(const std::vector<std::byte>& bytes, STGMEDIUM* pmedium);
    [[nodiscard]] bool hasFileList() const noexcept { return !drop_files_.empty(); }
    [[nodiscard]] bool hasVirtualFiles() const noexcept { return !virtual_files_.empty(); }

    LONG ref_count_ = 1;
    LONG outstanding_ = 0;
    std::vector<std::byte> drop_files_;
    std::vector<VirtualFile> virtual_files_;
    std::vector<LONG> content_requests_;
    CLIPFORMAT cf_descriptor_;
    CLIPFORMAT cf_contents_;
};

/// @brief Make a HGLOBAL holding a copy of the bytes
[[nodiscard]] HGLOBAL makeGlobal(const std::vector<std::byte>& bytes);

/// @brief Bytes of a string, for file contents
[[nodiscard]] std::vector<std::byte> toBytes(std::string_view text);

/// @brief Read a whole file as a string
[[nodiscard]] std::string readFile(const std::filesystem::path& path);

}  // namespace shelldrop::test
