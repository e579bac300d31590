/*
 * Copyright (C) 2026 The davdiscover authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) version 3.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301  USA
 */

#ifndef INCL_DAVDISCOVER_OUTCOME
#define INCL_DAVDISCOVER_OUTCOME

#include <davdiscover/DAVStatus.h>
#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Result of one discovery step. Distinguishes between "the server
 * answered, but there is nothing usable" (ABSENT) and "talking to
 * the server did not work" (FAILED), so that the log can explain
 * why a step did not produce a value while the caller simply
 * moves on to the next step in both cases.
 */
template<class T> class Outcome
{
 public:
    enum State {
        FOUND,
        ABSENT,
        FAILED
    };

    static Outcome found(const T &value) { return Outcome(FOUND, value, "", STATUS_OK); }
    static Outcome absent(const std::string &reason = "") { return Outcome(ABSENT, T(), reason, STATUS_OK); }
    static Outcome failed(const std::string &explanation, DAVStatus status) { return Outcome(FAILED, T(), explanation, status); }

    /**
     * Turn the exception which is currently being handled into a
     * FAILED outcome. Must be called inside a catch block. The
     * exception is logged at DEBUG level, 404 included.
     */
    static Outcome fromException(const Logger::Handle &logger, const std::string &prefix)
    {
        std::string explanation;
        DAVStatus status = Exception::handle(NULL, &prefix, &explanation,
                                             Logger::DEBUG,
                                             HANDLE_EXCEPTION_404_IS_OKAY,
                                             logger);
        return failed(explanation, status);
    }

    State getState() const { return m_state; }
    bool isFound() const { return m_state == FOUND; }
    bool isFailed() const { return m_state == FAILED; }

    /** the value, throws if not FOUND */
    const T &get() const
    {
        if (m_state != FOUND) {
            DD_THROW(StringPrintf("no value: %s", m_explanation.c_str()));
        }
        return m_value;
    }

    /** why there is no value, empty for FOUND */
    const std::string &getExplanation() const { return m_explanation; }
    /** status of a FAILED outcome, STATUS_OK otherwise */
    DAVStatus getStatus() const { return m_status; }

    /** FOUND/ABSENT/FAILED plus explanation */
    std::string toString() const
    {
        switch (m_state) {
        case FOUND:
            return "found";
        case ABSENT:
            return m_explanation.empty() ? "absent" : "absent: " + m_explanation;
        case FAILED:
            return "failed: " + m_explanation;
        }
        return "";
    }

 private:
    Outcome(State state, const T &value, const std::string &explanation, DAVStatus status) :
        m_state(state),
        m_value(value),
        m_explanation(explanation),
        m_status(status)
    {}

    State m_state;
    T m_value;
    std::string m_explanation;
    DAVStatus m_status;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_OUTCOME
