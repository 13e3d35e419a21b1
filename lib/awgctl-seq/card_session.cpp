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

#include "card_session.h"
#include "error.h"

#include "../awgctl-utils/log.h"

namespace AwgCtl::Seq {

AWGCTL_EXPORT() const char *state_name(CardSession::State state)
{
    switch (state) {
    case CardSession::State::Disconnected:
        return "disconnected";
    case CardSession::State::Connected:
        return "connected";
    case CardSession::State::Configured:
        return "configured";
    case CardSession::State::Uploaded:
        return "uploaded";
    default:
        return "unknown";
    }
}

CardSession::CardSession(CardOpener &opener, int64_t serial, CardSettings settings)
    : m_opener(opener),
      m_serial(serial),
      m_settings(settings)
{
}

CardSession::~CardSession()
{
    // Releasing the handle does not stop a running sequence.
    if (m_card) {
        awgDebug("Releasing card %lld\n", (long long)m_serial);
    }
}

Card &CardSession::connect()
{
    if (m_card)
        return *m_card;
    auto card = m_opener.open(m_serial, CardType::AnalogOut);
    if (!card)
        throw HardwareError(Error::Hardware::Open,
                            "Cannot open card " + std::to_string(m_serial) + ".");
    m_card = std::move(card);
    m_state = State::Connected;
    awgInfo("Connected to card %lld\n", (long long)m_serial);
    return *m_card;
}

Card &CardSession::card()
{
    if (!m_card)
        throw SessionStateError(Error::SessionState::NotConnected, "Card not connected.");
    return *m_card;
}

void CardSession::configure_once(int64_t sample_rate, int32_t full_scale_mv,
                                 const PhysicalSetup &setup)
{
    if (configured())
        return;
    auto &card = this->card();
    auto nchn = setup.nchannels();
    card.card_mode(CardMode::Sequence);
    card.enable_channels(setup.channel_mask());
    for (uint32_t chn = 0; chn < nchn; chn++) {
        card.channel_output(chn, true);
        card.output_load(chn, m_settings.output_load_ohm);
        card.amplitude(chn, full_scale_mv);
        card.stop_level(chn, StopLevel::HoldLast);
    }
    card.trigger_or_mask(TrigExt0);
    card.trigger_ext0_mode(TriggerMode::Pos);
    card.trigger_ext0_level0(m_settings.trigger_level_mv);
    card.trigger_ext0_coupling(Coupling::DC);
    card.trigger_termination(m_settings.trigger_termination);
    card.trigger_delay(m_settings.trigger_delay);
    card.clock_mode(ClockMode::IntPLL);
    card.set_sample_rate(sample_rate);
    card.clock_output(false);
    auto actual = card.get_sample_rate();
    if (actual != sample_rate)
        awgWarn("Requested sample rate %lld Hz, card runs at %lld Hz\n",
                (long long)sample_rate, (long long)actual);
    m_state = State::Configured;
    awgInfo("Configured card %lld: %u channel(s), %d mV, %lld Hz\n", (long long)m_serial,
            nchn, full_scale_mv, (long long)actual);
}

void CardSession::install(std::shared_ptr<UploadSession> session)
{
    if (!configured())
        throw SessionStateError(Error::SessionState::Inconsistent,
                                std::string("Cannot install upload on a ") +
                                state_name(m_state) + " card.");
    if (!session)
        throw SessionStateError(Error::SessionState::NoUpload, "Empty upload session.");
    m_upload = std::move(session);
    m_state = State::Uploaded;
}

void CardSession::invalidate()
{
    m_upload.reset();
    if (m_card) {
        m_state = State::Connected;
    }
    else {
        m_state = State::Disconnected;
    }
}

void CardSession::close()
{
    if (!m_card)
        return;
    auto cleanup = make_scope_exit([&] {
        m_upload.reset();
        m_card.reset();
        m_state = State::Disconnected;
    });
    awgInfo("Closing card %lld\n", (long long)m_serial);
    m_card->stop(StopDMA);
}

}
