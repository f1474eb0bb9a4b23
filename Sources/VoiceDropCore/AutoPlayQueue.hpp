#pragma once

#include "EventChannel.hpp"
#include "Executor.hpp"
#include "MessengerSession.hpp"

#include <deque>
#include <mutex>
#include <optional>

namespace vd {

/// Turns incoming voice notes into playback hand-offs, one at a time and in
/// order of arrival.
///
/// A note is held while the send pipeline is busy.  Otherwise the head of
/// the queue is downloaded (a cached local file is reused) and published on
/// `voice_ready`; the next note waits until playback_finished().  When the
/// backend accepts a download but has not finished it, the note stays at
/// the head until its DownloadCompleted arrives.  A note whose download
/// fails is dropped.
///
/// All work runs on the control executor.
class AutoPlayQueue {
public:
    AutoPlayQueue(MessengerSession& session, Notifications& notifications, Executor& control);
    ~AutoPlayQueue();

    // Non-copyable.
    AutoPlayQueue(const AutoPlayQueue&) = delete;
    AutoPlayQueue& operator=(const AutoPlayQueue&) = delete;

    /// The host finished playing the last published note.
    void playback_finished();

    /// Drop every queued note.  A note already handed off keeps playing.
    void clear();

    size_t pending() const;
    bool   is_playing() const;
    bool   is_held() const;

    /// File id of the head note while its download is deferred.
    std::optional<FileId> deferred_file() const;

private:
    void on_incoming(const IncomingVoiceMessage& note);
    void on_activity(bool busy);
    void on_download_completed(const DownloadCompleted& done);
    void on_download_reply(const IncomingVoiceMessage& note, const Reply<FileInfo>& reply);

    /// Start the next download if nothing blocks it.
    void advance();

    MessengerSession& session_;
    Notifications&    notifications_;
    Executor&         control_;

    EventChannel<IncomingVoiceMessage>::Token incoming_token_ = 0;
    EventChannel<DownloadCompleted>::Token    download_token_ = 0;
    EventChannel<PipelineActivity>::Token     activity_token_ = 0;

    mutable std::mutex               mu_;
    std::deque<IncomingVoiceMessage> queue_;
    bool                             held_        = false;
    bool                             downloading_ = false;
    bool                             playing_     = false;
    std::optional<FileId>            deferred_;
};

} // namespace vd
