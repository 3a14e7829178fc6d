#include "tab2fig/core/ErrorCode.hpp"

namespace tab2fig {
namespace core {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::NotTabular: return "NotTabular";
        case ErrorCode::EmptyTable: return "EmptyTable";
        case ErrorCode::RaggedRows: return "RaggedRows";
        case ErrorCode::MalformedInput: return "MalformedInput";
        case ErrorCode::UnknownTheme: return "UnknownTheme";
        case ErrorCode::DuplicateTheme: return "DuplicateTheme";
        case ErrorCode::BuiltinThemeName: return "BuiltinThemeName";
        case ErrorCode::ColumnSpecMismatch: return "ColumnSpecMismatch";
        case ErrorCode::InvalidColumnToken: return "InvalidColumnToken";
        case ErrorCode::HeaderSpanMismatch: return "HeaderSpanMismatch";
        case ErrorCode::InvalidPackageOption: return "InvalidPackageOption";
        case ErrorCode::UnknownAdapter: return "UnknownAdapter";
        case ErrorCode::DirectoryNotCreatable: return "DirectoryNotCreatable";
        case ErrorCode::DirectoryNotWritable: return "DirectoryNotWritable";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::ToolFailed: return "ToolFailed";
        case ErrorCode::ToolTimeout: return "ToolTimeout";
        case ErrorCode::ToolSpawnFailed: return "ToolSpawnFailed";
        case ErrorCode::ArtifactMissing: return "ArtifactMissing";
    }
    return "Unknown";
}

}} // namespace tab2fig::core
