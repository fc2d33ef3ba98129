#pragma once

namespace formdrop {

// Parse-time failures of a multipart upload. Storage failures are not listed
// here, they are reported as StorageError by the storage layer.
enum class UploadError {
    None,
    NotMultipart,
    MissingBoundary,
    BoundaryNotFound,
    MalformedPart,
    NoHeaderTerminator,
    InvalidFilenameEncoding,
};


inline const char* to_string(UploadError error) {
    switch(error) {
        case UploadError::None: return "None";
        case UploadError::NotMultipart: return "NotMultipart";
        case UploadError::MissingBoundary: return "MissingBoundary";
        case UploadError::BoundaryNotFound: return "BoundaryNotFound";
        case UploadError::MalformedPart: return "MalformedPart";
        case UploadError::NoHeaderTerminator: return "NoHeaderTerminator";
        case UploadError::InvalidFilenameEncoding: return "InvalidFilenameEncoding";
        default: return "UNKNOWN";
    }
}

} // namespace formdrop
