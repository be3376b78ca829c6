#pragma once

namespace features {

/**
 * @brief Receives the read-only session view whenever the session changes
 *
 * The controller publishes after every state change, scored attempt and
 * connection event. A sink may render the view, write it to a log stream,
 * or forward it to a UI process; it never feeds anything back.
 *
 * @tparam ViewT Session view type
 */
template<typename ViewT>
class PresentationSink {
public:
    virtual ~PresentationSink() = default;

    /**
     * @brief Called from the session loop; must return promptly
     * @param view Current session view
     */
    virtual void publish(const ViewT& view) = 0;
};

/**
 * @brief Sink for headless sessions and tests that only read the controller
 */
template<typename ViewT>
class NoPresentationSink : public PresentationSink<ViewT> {
public:
    void publish(const ViewT& /*view*/) override {}
};

} // namespace features
