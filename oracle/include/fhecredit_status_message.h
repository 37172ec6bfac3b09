#pragma once

#include "include/fhecredit_status_codes.h"

inline const char *oracle_status_name(OracleStatusCode code)
{
    switch (code)
    {
    case kSuccess:
        return "kSuccess";
    case kUnknownError:
        return "kUnknownError";
    case kInvalidInput:
        return "kInvalidInput";
    case kUnauthorizedCaller:
        return "kUnauthorizedCaller";
    case kMalformedCiphertext:
        return "kMalformedCiphertext";
    case kProfileNotFound:
        return "kProfileNotFound";
    case kScoreNotComputed:
        return "kScoreNotComputed";
    case kStaleScore:
        return "kStaleScore";
    case kInvalidPool:
        return "kInvalidPool";
    case kPoolInactive:
        return "kPoolInactive";
    case kIntegerOverflow:
        return "kIntegerOverflow";
    case kCryptoError:
        return "kCryptoError";
    case kDecodingError:
        return "kDecodingError";
    case kEncodingError:
        return "kEncodingError";
    case kConfigurationError:
        return "kConfigurationError";
    }
    return "kUnknownStatusCode";
}

inline const char *oracle_status_message(OracleStatusCode code)
{
    switch (code)
    {
    case kSuccess:
        return "Success";
    case kUnknownError:
        return "An unexpected error occurred";
    case kInvalidInput:
        return "The input is invalid";
    case kUnauthorizedCaller:
        return "The caller is not authorized to perform this operation";
    case kMalformedCiphertext:
        return "The opaque value has an unexpected length or failed validation";
    case kProfileNotFound:
        return "No credit profile exists for this owner";
    case kScoreNotComputed:
        return "No credit score has been computed for this profile";
    case kStaleScore:
        return "The credit score predates the latest profile submission";
    case kInvalidPool:
        return "The lending pool does not exist";
    case kPoolInactive:
        return "The lending pool is inactive";
    case kIntegerOverflow:
        return "The result is outside the supported integer range";
    case kCryptoError:
        return "A cryptographic operation failed";
    case kDecodingError:
        return "Failed to decode the input";
    case kEncodingError:
        return "Failed to encode the output";
    case kConfigurationError:
        return "The configuration is invalid";
    }
    return "Unknown status code";
}
