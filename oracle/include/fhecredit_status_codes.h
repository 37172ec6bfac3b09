#pragma once

enum OracleStatusCode
{
    kSuccess = 0,
    kUnknownError = 1,
    kInvalidInput = 2,
    kUnauthorizedCaller = 3,
    kMalformedCiphertext = 4,
    kProfileNotFound = 5,
    kScoreNotComputed = 6,
    kStaleScore = 7,
    kInvalidPool = 8,
    kPoolInactive = 9,
    kIntegerOverflow = 10,
    kCryptoError = 11,
    kDecodingError = 12,
    kEncodingError = 13,
    kConfigurationError = 14
};
