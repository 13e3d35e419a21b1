/*************************************************************************
 *   Copyright (c) 2026 - 2026 Yichao Yu <yyc1992@gmail.com>             *
 *                                                                       *
 *   This library is free software; you can redistribute it and/or       *
 *   modify it under the terms of the GNU Lesser General Public          *
 *   License as published by the Free Software Foundation; either        *
 *   version 3.0 of the License, or (at your option) any later version.  *
 *                                                                       *
 *   This library is distributed in the hope that it will be useful,     *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of      *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU    *
 *   Lesser General Public License for more details.                     *
 *                                                                       *
 *   You should have received a copy of the GNU Lesser General Public    *
 *   License along with this library. If not,                            *
 *   see <http://www.gnu.org/licenses/>.                                 *
 *************************************************************************/

#ifndef __AWGCTL_SEQ_CARD_SESSION_H__
#define __AWGCTL_SEQ_CARD_SESSION_H__

#include "card.h"
#include "physical_setup.h"
#include "upload.h"

#include <memory>

namespace AwgCtl::Seq {

// Output and trigger settings applied together with the clock setup.
struct CardSettings {
    double output_load_ohm = 50;
    int32_t trigger_level_mv = 800;
    bool trigger_termination = true;
    uint64_t trigger_delay = 0;
};

/**
 * Exclusive handle to one card.
 *
 * ```
 * Disconnected --connect--> Connected --configure_once--> Configured --install--> Uploaded
 * ```
 * `invalidate` goes back to `Connected` (keeping the handle) and
 * `close` to `Disconnected` from any state.
 * A failed `connect` or `configure_once` leaves the state unchanged so that
 * the next call retries.
 */
class AWGCTL_EXPORT() CardSession {
public:
    enum class State : uint8_t {
        Disconnected,
        Connected,
        Configured,
        Uploaded,
    };

    CardSession(CardOpener &opener, int64_t serial, CardSettings settings={});
    CardSession(const CardSession&) = delete;
    CardSession &operator=(const CardSession&) = delete;
    ~CardSession();

    State state() const
    {
        return m_state;
    }
    int64_t serial() const
    {
        return m_serial;
    }
    const CardSettings &settings() const
    {
        return m_settings;
    }
    bool connected() const
    {
        return m_state != State::Disconnected;
    }
    bool configured() const
    {
        return m_state == State::Configured || m_state == State::Uploaded;
    }

    Card &connect();
    // Throws `SessionStateError` when not connected.
    Card &card();
    // No-op when already configured on this connection.
    void configure_once(int64_t sample_rate, int32_t full_scale_mv,
                        const PhysicalSetup &setup);
    // Record the program resident after an upload. Requires a configured card.
    void install(std::shared_ptr<UploadSession> session);
    // Null unless in the `Uploaded` state.
    const std::shared_ptr<UploadSession> &upload_session() const
    {
        return m_upload;
    }
    // Forget the configuration and the resident program but keep the handle.
    void invalidate();
    // Stop DMA and release the handle. Both the handle and the state are
    // cleared even if stopping fails, in which case the error is rethrown.
    void close();

private:
    CardOpener &m_opener;
    const int64_t m_serial;
    const CardSettings m_settings;
    State m_state = State::Disconnected;
    std::unique_ptr<Card> m_card;
    std::shared_ptr<UploadSession> m_upload;
};

const char *state_name(CardSession::State state);

}

#endif
