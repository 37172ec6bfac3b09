#pragma once

// Opaque value layout (simulation backend): keyed tag followed by the masked value field
#define FHECREDIT_VALUE_FIELD_LEN 32 // 256-bit big-endian plaintext field
#define FHECREDIT_TAG_LEN 32         // HMAC-SHA256 tag
#define FHECREDIT_OPAQUE_VALUE_LEN (FHECREDIT_TAG_LEN + FHECREDIT_VALUE_FIELD_LEN)

#define FHECREDIT_SHA_256_LEN 32
#define FHECREDIT_DIGEST_KEY_LEN 32
#define FHECREDIT_IDENTITY_LEN 20

// Scoring weights (payment history, income, credit utilization, assets)
#define FHECREDIT_PAYMENT_HISTORY_WEIGHT 35
#define FHECREDIT_INCOME_WEIGHT 3
#define FHECREDIT_UTILIZATION_WEIGHT 20
#define FHECREDIT_ASSET_WEIGHT 15

// Scores are carried in hundredths of a weighted point
#define FHECREDIT_SCORE_SCALE_NUMERATOR 100

// Loan candidate = score * FHECREDIT_LOAN_SCALE, capped by the pool maximum.
// Pool min_score and max_loan are compared against these raw values, so they
// share the units above: a score of 600 gives a candidate of 6000.
#define FHECREDIT_LOAN_SCALE 10

#define FHECREDIT_MAX_CBOR_LEN 4096
#define FHECREDIT_MAX_POOL_NAME_LEN 64
#define FHECREDIT_MAX_INTEREST_RATE_BPS 10000

#define FHECREDIT_SIMULATION_SCHEME "simulation-v1"
