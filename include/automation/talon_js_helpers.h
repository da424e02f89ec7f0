#pragma once

#include <string>
#include "talon_eval_options.h"

namespace talon {

// Source of the helper object installed once per page (and per frame page).
// Each function runs with |this| bound to the element.
inline const char* HelperObjectSource() {
  return R"JS(function() {
  const isVisible = (el) => {
    if (el.nodeType === Node.TEXT_NODE) el = el.parentElement;
    if (!el || !el.isConnected) return false;
    const style = window.getComputedStyle(el);
    if (style.visibility === 'hidden' || style.display === 'none') return false;
    const rect = el.getBoundingClientRect();
    return rect.width > 0 && rect.height > 0;
  };

  return {
    visible() { return isVisible(this); },

    invisible() { return !isVisible(this); },

    containsElement(target) {
      let node = target;
      while (node) {
        if (node === this) return true;
        node = node.parentNode || node.host;
      }
      return false;
    },

    text() {
      switch (this.tagName) {
        case 'INPUT':
        case 'TEXTAREA':
          return this.value;
        case 'SELECT':
          return Array.from(this.selectedOptions).map((o) => o.innerText).join();
        default:
          return this.innerText;
      }
    },

    selectText(pattern) {
      const m = this.value.match(new RegExp(pattern));
      if (m) this.setSelectionRange(m.index, m.index + m[0].length);
    },

    selectAllText() {
      this.select();
    },

    inputEvent() {
      this.dispatchEvent(new Event('input', { bubbles: true }));
      this.dispatchEvent(new Event('change', { bubbles: true }));
    },

    select(selectors) {
      selectors.forEach((s) => {
        Array.from(this.options).find((el) => {
          try {
            if (el.innerText.includes(s) || el.matches(s)) {
              el.selected = true;
              return true;
            }
          } catch (e) {}
          return false;
        });
      });
      this.dispatchEvent(new Event('input', { bubbles: true }));
      this.dispatchEvent(new Event('change', { bubbles: true }));
    },

    resource() {
      return new Promise((resolve, reject) => {
        if (this.complete) return resolve(this.currentSrc);
        this.addEventListener('load', () => resolve(this.currentSrc));
        this.addEventListener('error', (e) => reject(e));
      });
    },

    waitLoad() {
      const isMedia = ['IMG', 'VIDEO', 'AUDIO', 'IFRAME'].includes(this.tagName);
      return new Promise((resolve) => {
        if (!isMedia || this.complete || this.readyState >= 2) return resolve(true);
        this.addEventListener('load', () => resolve(true));
        this.addEventListener('error', () => resolve(true));
      });
    }
  };
})JS";
}

namespace js_helper {
constexpr const char kVisible[] = "visible";
constexpr const char kInvisible[] = "invisible";
constexpr const char kContainsElement[] = "containsElement";
constexpr const char kText[] = "text";
constexpr const char kSelectText[] = "selectText";
constexpr const char kSelectAllText[] = "selectAllText";
constexpr const char kInputEvent[] = "inputEvent";
constexpr const char kSelect[] = "select";
constexpr const char kResource[] = "resource";
constexpr const char kWaitLoad[] = "waitLoad";
}  // namespace js_helper

// Options that call helper |name| with |args| on the element
inline EvalOptions JsHelper(const std::string& name, EvalArgs args = EvalArgs()) {
  EvalOptions opts("function(helpers, ...args) { return helpers." + name + ".apply(this, args) }",
                   std::move(args));
  opts.use_helper = true;
  return opts;
}

}  // namespace talon
