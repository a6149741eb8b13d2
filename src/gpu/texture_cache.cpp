#include "gpu/texture_cache.h"

namespace pacer::gpu {

Log::Logger<Log::LogModule::TEXCACHE> TextureCacheTracker::log;

const char *
cache_miss_policy_name(const CacheMissPolicy policy)
{
  return policy == CacheMissPolicy::Disabled ? "disabled" : "page_switch_only";
}

TextureCacheTracker::TextureCacheTracker(const CacheMissPolicy policy) : m_policy(policy)
{
  return;
}

bool
TextureCacheTracker::bind_page(const u32 page)
{
  if (m_current_page == page) {
    return false;
  }

  log.debug("texture page %u -> %u",
            m_current_page.value_or(UINT32_MAX),
            page);
  m_current_page = page;
  return true;
}

bool
TextureCacheTracker::bind_clut(const u32 clut)
{
  if (m_current_clut == clut) {
    return false;
  }

  log.debug("clut %u -> %u", m_current_clut.value_or(UINT32_MAX), clut);
  m_current_clut = clut;
  return true;
}

CacheResult
TextureCacheTracker::resolve(const PrimitiveDescriptor &descriptor)
{
  CacheResult result;

  if (descriptor.kind == PrimitiveKind::LoadTexturePage) {
    result.page_switched = bind_page(*descriptor.texture_page);
    result.one_time_cycles = result.page_switched ? kPageSwitchCycles : 0;
    return result;
  }

  if (descriptor.kind == PrimitiveKind::LoadClut) {
    result.clut_switched = bind_clut(*descriptor.clut);
    result.one_time_cycles = result.clut_switched ? kClutSwitchCycles : 0;
    return result;
  }

  if (!effective_textured(descriptor)) {
    return result;
  }

  result.page_switched = bind_page(*descriptor.texture_page);
  if (result.page_switched) {
    result.one_time_cycles += kPageSwitchCycles;
  }

  if (descriptor.clut) {
    result.clut_switched = bind_clut(*descriptor.clut);
    if (result.clut_switched) {
      result.one_time_cycles += kClutSwitchCycles;
    }
  }

  result.per_pixel_surcharge = kTextureFetchCycles;
  if (m_policy == CacheMissPolicy::PageSwitchOnly && result.page_switched) {
    result.per_pixel_surcharge += kCacheMissCycles;
  }

  return result;
}

void
TextureCacheTracker::invalidate()
{
  log.debug("invalidated");
  m_current_page.reset();
  m_current_clut.reset();
}

void
TextureCacheTracker::restore(const std::optional<u32> page, const std::optional<u32> clut)
{
  m_current_page = page;
  m_current_clut = clut;
}

}
