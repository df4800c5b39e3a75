#include "app/context.hpp"
#include "core/log.hpp"

namespace tether::app {

AppContext::AppContext(RelaySettings settings, ClockFn clock, QObject* parent)
    : QObject(parent)
    , settings_(std::move(settings))
    , clock_(std::move(clock))
    , cache_(std::make_unique<network::DeviceCache>())
    , queue_(std::make_unique<network::EventQueue>(this))
    , relay_(std::make_unique<network::EventRelay>(*cache_, *queue_, this))
    , scheduler_(std::make_unique<network::RefreshScheduler>(*queue_, settings_.refresh, clock_, this))
    , dispatcher_(std::make_unique<network::CommandDispatcher>(this))
    , sms_(std::make_unique<sms::SmsReconciler>(this))
{
    dispatcher_->setPingMessage(settings_.ping_message);
    dispatcher_->setRingMessage(settings_.ring_message);
    wire();
}

AppContext::~AppContext() {
    if (source_) {
        source_->on_event = nullptr;
        source_->on_closed = nullptr;
    }
    scheduler_->stop();
}

void AppContext::wire() {
    // Queued so a push made while draining never re-enters the relay.
    connect(queue_.get(), &network::EventQueue::eventsAvailable,
            relay_.get(), &network::EventRelay::drain, Qt::QueuedConnection);

    connect(relay_.get(), &network::EventRelay::pairingBurstStarted,
            scheduler_.get(), &network::RefreshScheduler::markBurst);
    connect(relay_.get(), &network::EventRelay::stopped,
            scheduler_.get(), &network::RefreshScheduler::stop);

    connect(relay_.get(), &network::EventRelay::smsPayloadReceived, this,
            [this](const DeviceId& id, const QByteArray& payload) {
                sms_->ingestPayload(payload).inspect_err([&](const Error& e) {
                    qCDebug(tetherSmsLog) << "sms batch from" << id.value() << "rejected, code" << e.code;
                });
            });
    connect(relay_.get(), &network::EventRelay::contactsPayloadReceived, this,
            [this](const DeviceId& id, const QByteArray& payload) {
                sms_->applyContactsPayload(payload).inspect_err([&](const Error& e) {
                    qCDebug(tetherSmsLog) << "contacts batch from" << id.value() << "rejected, code" << e.code;
                });
            });
}

void AppContext::attachCore(network::CoreEventSource* source, network::CoreChannel* channel) {
    if (source_ && source_ != source) {
        source_->on_event = nullptr;
        source_->on_closed = nullptr;
    }

    source_ = source;
    if (source_) {
        source_->on_event = [this](events::CoreEvent event) {
            if (!queue_->push(std::move(event))) {
                qCDebug(tetherRelayLog) << "event after close dropped";
            }
        };
        source_->on_closed = [this]() { queue_->close(); };
    }
    dispatcher_->setChannel(channel);
}

Result<void, Error> AppContext::start() {
    if (!source_) {
        return Result<void, Error>::err(Error{"no Core event source attached", ErrorCode::NotInitialized});
    }

    auto started = source_->start().inspect_err([](const Error& e) {
        qCWarning(tetherAppLog) << "Core event source failed to start:"
                                << QString::fromStdString(e.message);
    });
    if (started.is_err()) {
        return started;
    }

    scheduler_->start();
    qCInfo(tetherAppLog) << "relay started";
    return Result<void, Error>::ok();
}

bool AppContext::post(events::CoreEvent event) {
    return queue_->push(std::move(event));
}

int AppContext::drainNow() {
    return relay_->drain();
}

void AppContext::loadConversations(const DeviceId& device) {
    dispatcher_->requestConversations(device);
}

void AppContext::openThread(const DeviceId& device, const QString& thread_id) {
    sms_->selectThread(thread_id);
    dispatcher_->requestConversation(device, thread_id);
}

QString AppContext::startChat(const DeviceId& device, const QString& phone_number) {
    const auto thread_id = sms_->startChat(phone_number, clock_());
    if (!thread_id.startsWith(QLatin1String(sms::SmsReconciler::kNewThreadPrefix))) {
        dispatcher_->requestConversation(device, thread_id);
    }
    return thread_id;
}

bool AppContext::sendSms(const DeviceId& device, const QString& body) {
    auto placeholder = sms_->sendMessage(body, clock_());
    if (!placeholder) {
        return false;
    }
    dispatcher_->sendSms(device, placeholder->address, placeholder->body);
    return true;
}

} // namespace tether::app
