// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_CONSENSUS_VALIDATION_H
#define ESCROWSWAP_CONSENSUS_VALIDATION_H

#include <string>

/** "reject" codes, one per error category */
static const unsigned int REJECT_INVALID = 0x10;     //!< malformed or mismatched input
static const unsigned int REJECT_POLICY = 0x20;      //!< caller not allowed / wrong lifecycle state
static const unsigned int REJECT_ARITHMETIC = 0x30;  //!< overflow, zero-amount, insufficient inventory

/** Capture information about rejected calls */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< call rejected, nothing mutated
        MODE_ERROR,   //!< run-time error
    } mode;
    std::string strRejectReason;
    unsigned int chRejectCode;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
                 unsigned int _chRejectCode = 0,
                 const std::string& _strRejectReason = "",
                 const std::string& _strDebugMessage = "")
    {
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

#endif // ESCROWSWAP_CONSENSUS_VALIDATION_H
