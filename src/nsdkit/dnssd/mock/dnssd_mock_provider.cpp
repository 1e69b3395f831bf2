/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/mock/dnssd_mock_provider.hpp"

#include "nsdkit/core/exception.hpp"

#include <boost/asio/post.hpp>

nsd::dnssd::MockProvider::MockProvider(boost::asio::io_context& io_context) : io_context_(io_context) {}

nsd::dnssd::MockProvider::~MockProvider() {
    lifetime_.invalidate();
}

void nsd::dnssd::MockProvider::mock_advertise_succeeded(const std::optional<std::string>& effective_name) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), effective_name] {
        AdvertiseHandler handler;
        std::string name;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_advertise_) {
                NSD_THROW_EXCEPTION("No advertise request pending");
            }
            auto pending = std::move(*pending_advertise_);
            pending_advertise_.reset();
            advertised_ = pending.descriptor;
            if (effective_name) {
                advertised_->name = *effective_name;
            }
            name = advertised_->name;
            handler = std::move(pending.handler);
        }
        handler(name);
    });
}

void nsd::dnssd::MockProvider::mock_advertise_failed(const ProviderStatus code) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), code] {
        AdvertiseHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_advertise_) {
                NSD_THROW_EXCEPTION("No advertise request pending");
            }
            handler = std::move(pending_advertise_->handler);
            pending_advertise_.reset();
        }
        handler(tl::unexpected(code));
    });
}

void nsd::dnssd::MockProvider::mock_withdraw_succeeded() {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak()] {
        CompletionHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_withdraw_) {
                NSD_THROW_EXCEPTION("No withdraw request pending");
            }
            handler = std::move(pending_withdraw_);
            pending_withdraw_ = nullptr;
            advertised_.reset();
        }
        handler({});
    });
}

void nsd::dnssd::MockProvider::mock_withdraw_failed(const ProviderStatus code) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), code] {
        CompletionHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_withdraw_) {
                NSD_THROW_EXCEPTION("No withdraw request pending");
            }
            handler = std::move(pending_withdraw_);
            pending_withdraw_ = nullptr;
        }
        handler(tl::unexpected(code));
    });
}

void nsd::dnssd::MockProvider::mock_watch_succeeded() {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak()] {
        CompletionHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_watch_) {
                NSD_THROW_EXCEPTION("No watch request pending");
            }
            watched_type_ = pending_watch_->reg_type;
            handler = std::move(pending_watch_->handler);
            pending_watch_.reset();
        }
        handler({});
    });
}

void nsd::dnssd::MockProvider::mock_watch_failed(const ProviderStatus code) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), code] {
        CompletionHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_watch_) {
                NSD_THROW_EXCEPTION("No watch request pending");
            }
            handler = std::move(pending_watch_->handler);
            pending_watch_.reset();
        }
        handler(tl::unexpected(code));
    });
}

void nsd::dnssd::MockProvider::mock_unwatch_succeeded() {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak()] {
        CompletionHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_unwatch_) {
                NSD_THROW_EXCEPTION("No unwatch request pending");
            }
            handler = std::move(pending_unwatch_);
            pending_unwatch_ = nullptr;
            watched_type_.reset();
        }
        handler({});
    });
}

void nsd::dnssd::MockProvider::mock_unwatch_failed(const ProviderStatus code) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), code] {
        CompletionHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!pending_unwatch_) {
                NSD_THROW_EXCEPTION("No unwatch request pending");
            }
            handler = std::move(pending_unwatch_);
            pending_unwatch_ = nullptr;
        }
        handler(tl::unexpected(code));
    });
}

void nsd::dnssd::MockProvider::mock_service_found(
    const std::string& name, const std::string& reg_type, const std::string& domain
) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), name, reg_type, domain] {
        ServiceReference reference;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!watched_type_) {
                NSD_THROW_EXCEPTION("Not watching, can't find service: {}", name);
            }
            reference = ServiceReference {name, reg_type.empty() ? *watched_type_ : reg_type, domain};
        }
        on_service_found(reference);
    });
}

void nsd::dnssd::MockProvider::mock_service_lost(
    const std::string& name, const std::string& reg_type, const std::string& domain
) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), name, reg_type, domain] {
        ServiceReference reference;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!watched_type_) {
                NSD_THROW_EXCEPTION("Not watching, can't lose service: {}", name);
            }
            reference = ServiceReference {name, reg_type.empty() ? *watched_type_ : reg_type, domain};
        }
        on_service_lost(reference);
    });
}

void nsd::dnssd::MockProvider::mock_resolve_succeeded(
    const std::string& name, const std::string& host_target, const std::string& address, const uint16_t port,
    const TxtRecord& txt
) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), name, host_target, address, port, txt] {
        ResolveHandler handler;
        ResolvedService service;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            auto pending = take_pending_resolve(name);
            service.name = pending.reference.name;
            service.reg_type = pending.reference.reg_type;
            service.domain = pending.reference.domain;
            handler = std::move(pending.handler);
        }
        service.host_target = host_target;
        service.address = address;
        service.port = port;
        service.txt = txt;
        handler(std::move(service));
    });
}

void nsd::dnssd::MockProvider::mock_resolve_failed(const std::string& name, const ProviderStatus code) {
    boost::asio::post(io_context_, [this, lifetime = lifetime_.get_weak(), name, code] {
        ResolveHandler handler;
        {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            handler = take_pending_resolve(name).handler;
        }
        handler(tl::unexpected(code));
    });
}

std::vector<std::string> nsd::dnssd::MockProvider::get_requests() const {
    std::lock_guard guard(lifetime_.mutex());
    return requests_;
}

std::optional<nsd::dnssd::ServiceDescriptor> nsd::dnssd::MockProvider::get_advertised_service() const {
    std::lock_guard guard(lifetime_.mutex());
    return advertised_;
}

std::optional<std::string> nsd::dnssd::MockProvider::get_watched_type() const {
    std::lock_guard guard(lifetime_.mutex());
    return watched_type_;
}

size_t nsd::dnssd::MockProvider::get_pending_resolve_count() const {
    std::lock_guard guard(lifetime_.mutex());
    return pending_resolves_.size();
}

void nsd::dnssd::MockProvider::advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler) {
    std::lock_guard guard(lifetime_.mutex());
    if (pending_advertise_) {
        NSD_THROW_EXCEPTION("Advertise request already pending for: {}", pending_advertise_->descriptor.name);
    }
    if (advertised_) {
        NSD_THROW_EXCEPTION("Service already advertised: {}", advertised_->name);
    }
    requests_.push_back("advertise:" + descriptor.name);
    pending_advertise_ = PendingAdvertise {descriptor, std::move(handler)};
}

void nsd::dnssd::MockProvider::withdraw(CompletionHandler handler) {
    std::lock_guard guard(lifetime_.mutex());
    if (pending_withdraw_) {
        NSD_THROW_EXCEPTION("Withdraw request already pending");
    }
    if (!advertised_) {
        NSD_THROW_EXCEPTION("No service advertised");
    }
    requests_.emplace_back("withdraw");
    pending_withdraw_ = std::move(handler);
}

void nsd::dnssd::MockProvider::watch(const std::string& reg_type, CompletionHandler handler) {
    std::lock_guard guard(lifetime_.mutex());
    if (pending_watch_) {
        NSD_THROW_EXCEPTION("Watch request already pending for: {}", pending_watch_->reg_type);
    }
    if (watched_type_) {
        NSD_THROW_EXCEPTION("Already watching: {}", *watched_type_);
    }
    requests_.push_back("watch:" + reg_type);
    pending_watch_ = PendingWatch {reg_type, std::move(handler)};
}

void nsd::dnssd::MockProvider::unwatch(CompletionHandler handler) {
    std::lock_guard guard(lifetime_.mutex());
    if (pending_unwatch_) {
        NSD_THROW_EXCEPTION("Unwatch request already pending");
    }
    if (!watched_type_) {
        NSD_THROW_EXCEPTION("Not watching");
    }
    requests_.emplace_back("unwatch");
    pending_unwatch_ = std::move(handler);
}

void nsd::dnssd::MockProvider::resolve(const ServiceReference& reference, ResolveHandler handler) {
    std::lock_guard guard(lifetime_.mutex());
    requests_.push_back("resolve:" + reference.name);
    pending_resolves_.push_back(PendingResolve {reference, std::move(handler)});
}

nsd::dnssd::MockProvider::PendingResolve nsd::dnssd::MockProvider::take_pending_resolve(const std::string& name) {
    for (auto it = pending_resolves_.begin(); it != pending_resolves_.end(); ++it) {
        if (it->reference.name == name) {
            auto pending = std::move(*it);
            pending_resolves_.erase(it);
            return pending;
        }
    }
    NSD_THROW_EXCEPTION("No resolve request pending for: {}", name);
}
