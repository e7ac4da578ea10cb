/**
 * mesh_errors.h - Error taxonomy shared by all meshlink components
 * 
 * Components never throw across their boundary. They return a failure
 * indicator and report the cause once through an injected ErrorSink.
 */

#ifndef MESH_ERRORS_H
#define MESH_ERRORS_H

#include <functional>
#include <string>

enum MeshErrorKind {
    ERR_DECODE,            // malformed wire bytes, tagged with the section name
    ERR_TRANSPORT,         // write or connectivity failure
    ERR_CONFIG_CONFLICT,   // no free channel slot, primary channel protection
    ERR_VALIDATION,        // rejected input, e.g. MQTT enabled without address
    ERR_STORE              // persistence failure
};

struct MeshError {
    MeshErrorKind kind;
    std::string section;   // protocol section or operation that failed
    std::string message;

    MeshError() : kind(ERR_DECODE) {}
    MeshError(MeshErrorKind k, const std::string& s, const std::string& m)
        : kind(k), section(s), message(m) {}
};

typedef std::function<void(const MeshError&)> ErrorSink;

inline const char* meshErrorKindName(MeshErrorKind kind) {
    switch (kind) {
        case ERR_DECODE:          return "DecodeError";
        case ERR_TRANSPORT:       return "TransportError";
        case ERR_CONFIG_CONFLICT: return "ConfigConflictError";
        case ERR_VALIDATION:      return "ValidationError";
        case ERR_STORE:           return "StoreError";
    }
    return "Error";
}

#endif // MESH_ERRORS_H
